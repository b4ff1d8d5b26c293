#pragma once

#include "env/environment_info.hpp"
#include "platform/system_source.hpp"

#include <string_view>

// Recognize a desktop name as it appears in XDG_CURRENT_DESKTOP and friends
// ("KDE", "X-Cinnamon", "GNOME-Classic", "plasmawayland", ...).
DesktopEnv desktop_from_name(std::string_view name);

// Combines OS release metadata, session variables and the process table into
// one EnvironmentInfo. Reads through the SystemSource only and writes nothing,
// so repeated calls on unchanged input give identical results.
class EnvironmentProbe {
public:
    explicit EnvironmentProbe(const SystemSource& source);

    EnvironmentInfo detect(const PartialOverrides& overrides = {}) const;

private:
    SessionType detect_session() const;
    DesktopEnv detect_desktop() const;
    std::string detect_wm(const EnvironmentInfo& info) const;

    const SystemSource& source_;
};
