#pragma once

#include <optional>
#include <string>
#include <vector>

struct ProcessEntry {
    int pid = 0;
    std::string comm;  // kernel short name, at most TASK_COMM_LEN - 1 characters
};

// Read-only view of the OS state environment detection depends on.
// Lets detection run against fixtures instead of the live system.
class SystemSource {
public:
    virtual ~SystemSource() = default;

    // nullopt when the variable is unset.
    virtual std::optional<std::string> env(const std::string& name) const = 0;
    // nullopt when the file is missing or unreadable.
    virtual std::optional<std::string> read_file(const std::string& path) const = 0;
    virtual bool file_exists(const std::string& path) const = 0;
    virtual std::vector<ProcessEntry> processes() const = 0;
};
