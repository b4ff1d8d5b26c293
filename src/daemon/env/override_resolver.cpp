#include "env/override_resolver.hpp"

namespace {

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value && value->empty()) return std::nullopt;
    return value;
}

} // namespace

OverrideResolver::OverrideResolver(const SystemSource& source) : source_(source) {}

PartialOverrides OverrideResolver::resolve(const PartialOverrides& config_overrides) const {
    PartialOverrides from_env{
        .desktop_env = non_empty(source_.env(DE_OVERRIDE_VARIABLE)),
        .window_manager = non_empty(source_.env(WM_OVERRIDE_VARIABLE)),
    };
    PartialOverrides from_config{
        .desktop_env = non_empty(config_overrides.desktop_env),
        .window_manager = non_empty(config_overrides.window_manager),
    };
    return from_env.over(from_config);
}
