#pragma once

#include "platform/system_source.hpp"

#include <string>
#include <vector>

// Live SystemSource: process environment, the filesystem and /proc.
class ProcfsSystemSource : public SystemSource {
public:
    ProcfsSystemSource() = default;
    explicit ProcfsSystemSource(std::string proc_root);

    std::optional<std::string> env(const std::string& name) const override;
    std::optional<std::string> read_file(const std::string& path) const override;
    bool file_exists(const std::string& path) const override;
    std::vector<ProcessEntry> processes() const override;

private:
    std::string read_comm(int pid) const;

    std::string proc_root_ = "/proc";
};
