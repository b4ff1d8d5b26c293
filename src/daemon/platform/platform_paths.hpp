#pragma once

#include "platform/system_source.hpp"

#include <string>
#include <vector>

namespace platform {

// $XDG_CONFIG_HOME/winctx, or ~/.config/winctx. Empty when neither is known.
std::string config_dir();

// $XDG_DATA_HOME then $XDG_DATA_DIRS, with the XDG defaults for unset or
// empty variables. Most specific first.
std::vector<std::string> data_dirs(const SystemSource& source);

} // namespace platform
