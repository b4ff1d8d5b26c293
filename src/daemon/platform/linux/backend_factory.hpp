#pragma once

#include "config.hpp"
#include "platform/context_backend.hpp"
#include "platform/linux/dbus_connection.hpp"
#include "platform/linux/dbus_context_service.hpp"

#include <memory>

// Backend for a gated adapter. `service` receives any methods the backend
// exposes on the adapter object, so it must not be started yet.
std::unique_ptr<ContextBackend> make_backend(AdapterKind kind, const Config& config,
                                             DbusConnection& bus, DbusContextService& service);
