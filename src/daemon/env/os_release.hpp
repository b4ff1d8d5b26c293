#pragma once

#include "platform/system_source.hpp"

#include <map>
#include <string>
#include <string_view>

struct DistroInfo {
    std::string id;        // lower-case, e.g. "fedora", "nixos"
    std::string version;   // e.g. "39", "24.05"
    std::string variant;   // VARIANT_ID, e.g. "silverblue"
};

// Parse KEY=value lines as found in os-release and lsb-release.
// Surrounding quotes are removed; comments and malformed lines are skipped.
std::map<std::string, std::string> parse_release_file(std::string_view content);

// Resolve distro id/version from the release files a SystemSource exposes.
DistroInfo detect_distro(const SystemSource& source);

// Platforms that start compositors through wrapper scripts, so the kernel
// process name is a truncated or prefixed form of the real binary name.
bool wraps_binaries(std::string_view distro_id);
