#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <string_view>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/winctx";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/winctx";
}

std::vector<std::string> data_dirs(const SystemSource& source) {
    std::vector<std::string> dirs;

    auto data_home = source.env("XDG_DATA_HOME");
    if (data_home && !data_home->empty()) {
        dirs.push_back(*data_home);
    } else if (auto home = source.env("HOME"); home && !home->empty()) {
        dirs.push_back(*home + "/.local/share");
    }

    auto data_dirs = source.env("XDG_DATA_DIRS").value_or("");
    if (data_dirs.empty()) data_dirs = "/usr/local/share:/usr/share";

    std::string_view rest = data_dirs;
    while (!rest.empty()) {
        auto colon = rest.find(':');
        auto dir = rest.substr(0, colon);
        if (!dir.empty()) dirs.emplace_back(dir);
        if (colon == std::string_view::npos) break;
        rest.remove_prefix(colon + 1);
    }
    return dirs;
}

} // namespace platform
