#pragma once

#include "env/environment_info.hpp"
#include "platform/system_source.hpp"

inline constexpr char DE_OVERRIDE_VARIABLE[] = "WINCTX_DE_OVERRIDE";
inline constexpr char WM_OVERRIDE_VARIABLE[] = "WINCTX_WM_OVERRIDE";

// Collects explicit desktop/window-manager overrides. Environment variables
// take precedence over the values from the config file. Only empty strings are
// rejected; an unrecognized name still overrides detection.
class OverrideResolver {
public:
    explicit OverrideResolver(const SystemSource& source);

    PartialOverrides resolve(const PartialOverrides& config_overrides = {}) const;

private:
    const SystemSource& source_;
};
