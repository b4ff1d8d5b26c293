#include "platform/linux/backend_factory.hpp"

#include "platform/linux/cosmic_toplevel_backend.hpp"
#include "platform/linux/gnome_extension_backend.hpp"
#include "platform/linux/kwin_script_backend.hpp"
#include "platform/linux/procfs_system_source.hpp"
#include "platform/linux/wlr_toplevel_backend.hpp"
#include "platform/linux/x11_backend.hpp"

std::unique_ptr<ContextBackend> make_backend(AdapterKind kind, const Config& config,
                                             DbusConnection& bus, DbusContextService& service) {
    auto timeout = std::chrono::milliseconds(config.dbus.call_timeout_ms);
    auto roundtrip = std::chrono::milliseconds(config.wayland.roundtrip_timeout_ms);

    switch (kind) {
        case AdapterKind::GnomeExtension:
            return std::make_unique<GnomeExtensionBackend>(
                bus, timeout, std::chrono::milliseconds(config.gnome.poll_interval_ms));
        case AdapterKind::Kwin: {
            auto script = config.kwin.script_path;
            if (script.empty()) {
                script = KwinScriptBackend::locate_script(ProcfsSystemSource{}, config.kwin.script_name)
                             .value_or("");
            }
            return std::make_unique<KwinScriptBackend>(bus, service, config.kwin.script_name,
                                                       std::move(script), timeout);
        }
        case AdapterKind::Cosmic:
            return std::make_unique<CosmicToplevelBackend>(roundtrip);
        case AdapterKind::Wlroots:
            return std::make_unique<WlrToplevelBackend>(roundtrip);
        case AdapterKind::X11:
            return std::make_unique<X11Backend>();
    }
    return nullptr;
}
