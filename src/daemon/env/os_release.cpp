#include "env/os_release.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string value_of(const std::map<std::string, std::string>& kv, const std::string& key) {
    auto it = kv.find(key);
    return it != kv.end() ? it->second : std::string{};
}

// "24.11 (Vicuna) (pre)" -> "24.11"
std::string leading_token(std::string_view s) {
    s = trim(s);
    auto end = s.find_first_of(" \t,(");
    return std::string(s.substr(0, end));
}

// NAME="NixOS" -> "nixos", NAME="Fedora Linux" -> "fedora"
std::string id_from_name(std::string_view name) {
    return to_lower(leading_token(name));
}

} // namespace

std::map<std::string, std::string> parse_release_file(std::string_view content) {
    std::map<std::string, std::string> kv;

    while (!content.empty()) {
        auto nl = content.find('\n');
        auto line = trim(content.substr(0, nl));
        content = nl == std::string_view::npos ? std::string_view{} : content.substr(nl + 1);

        if (line.empty() || line.front() == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;

        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        kv[std::string(key)] = std::string(value);
    }

    return kv;
}

DistroInfo detect_distro(const SystemSource& source) {
    DistroInfo info;

    std::map<std::string, std::string> kv;
    for (const char* path : {"/etc/os-release", "/usr/lib/os-release"}) {
        if (auto content = source.read_file(path)) {
            kv = parse_release_file(*content);
            break;
        }
    }

    if (!kv.empty()) {
        info.id = to_lower(value_of(kv, "ID"));
        if (info.id.empty()) info.id = id_from_name(value_of(kv, "NAME"));

        info.version = value_of(kv, "VERSION_ID");
        if (info.version.empty()) info.version = leading_token(value_of(kv, "VERSION"));

        info.variant = to_lower(value_of(kv, "VARIANT_ID"));
    }

    if (info.id.empty()) {
        if (auto content = source.read_file("/etc/lsb-release")) {
            auto lsb = parse_release_file(*content);
            info.id = to_lower(value_of(lsb, "DISTRIB_ID"));
            if (info.version.empty()) info.version = value_of(lsb, "DISTRIB_RELEASE");
        }
    }

    // Marker files are authoritative even when release metadata disagrees.
    if (source.file_exists("/etc/NIXOS")) {
        info.id = "nixos";
    } else if (info.id.empty() && source.file_exists("/etc/arch-release")) {
        info.id = "arch";
    }

    return info;
}

bool wraps_binaries(std::string_view distro_id) {
    return distro_id == "nixos" || distro_id == "guix";
}
