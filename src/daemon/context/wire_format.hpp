#pragma once

#include "context/window_context.hpp"

#include <map>
#include <optional>
#include <string>

// Dictionary shape carried over D-Bus as a{ss}. An empty dictionary means
// "no current window"; a present but empty "app_class" is a real value.
using StringDict = std::map<std::string, std::string>;

namespace wire {

inline constexpr char APP_ID[] = "app_id";
inline constexpr char APP_CLASS[] = "app_class";
inline constexpr char WINDOW_TITLE[] = "window_title";
inline constexpr char SOURCE_ADAPTER[] = "source_adapter";
inline constexpr char OBSERVED_AT_US[] = "observed_at_us";

// Adapter interface members.
inline constexpr char SIGNAL_ACTIVE_WINDOW_CHANGED[] = "ActiveWindowChanged";
inline constexpr char SIGNAL_STATE_CHANGED[] = "StateChanged";
// GetActiveWindow while the backend connection is down.
inline constexpr char ERROR_STALE[] = "org.winctx.Error.Stale";
// GetState while the adapter is active but its backend connection is down.
inline constexpr char STATE_STALE[] = "stale";

StringDict to_dict(const std::optional<WindowContext>& ctx);

// Missing keys read as empty strings. An empty dictionary yields nullopt.
std::optional<WindowContext> from_dict(const StringDict& dict);

} // namespace wire
