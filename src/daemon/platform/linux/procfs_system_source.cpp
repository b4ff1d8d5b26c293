#include "platform/linux/procfs_system_source.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ProcfsSystemSource::ProcfsSystemSource(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::optional<std::string> ProcfsSystemSource::env(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::optional<std::string> ProcfsSystemSource::read_file(const std::string& path) const {
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

bool ProcfsSystemSource::file_exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::string ProcfsSystemSource::read_comm(int pid) const {
    std::ifstream f(std::format("{}/{}/comm", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::vector<ProcessEntry> ProcfsSystemSource::processes() const {
    std::vector<ProcessEntry> result;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err != std::errc{} || ptr != name.data() + name.size() || pid <= 0) continue;

        // Processes may exit between listing and reading.
        auto comm = read_comm(pid);
        if (comm.empty()) continue;

        result.push_back({pid, std::move(comm)});
    }

    return result;
}
