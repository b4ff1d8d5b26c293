#include "adapter/adapter_kind.hpp"
#include "config.hpp"
#include "env/environment_probe.hpp"
#include "env/override_resolver.hpp"
#include "platform/linux/dbus_context_client.hpp"
#include "platform/linux/procfs_system_source.hpp"
#include "platform/linux/x11_context_client.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <nlohmann/json.hpp>
#include <print>
#include <signal.h>
#include <string>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [-c config] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  env [--json]       Show the detected environment");
    std::println(stderr, "  current            Print the focused window once");
    std::println(stderr, "  watch              Print every focus change");
}

static json window_json(const HubSnapshot& snapshot) {
    json out = {{"alive", snapshot.alive}};
    if (snapshot.alive && snapshot.context) {
        const auto& ctx = *snapshot.context;
        out["window"] = {
            {"app_id", ctx.app_id},
            {"app_class", ctx.app_class},
            {"window_title", ctx.window_title},
            {"source_adapter", ctx.source_adapter},
        };
    } else {
        out["window"] = nullptr;
    }
    return out;
}

static int print_env(const EnvironmentInfo& env, std::optional<AdapterKind> adapter, bool as_json) {
    if (as_json) {
        json out = {
            {"distro_id", env.distro_id},
            {"distro_version", env.distro_version},
            {"variant_id", env.variant_id},
            {"desktop_env", env.desktop_name()},
            {"session_type", std::string(to_string(env.session_type))},
            {"window_manager", env.window_manager},
            {"adapter", adapter ? json(std::string(to_string(*adapter))) : json(nullptr)},
        };
        if (env.overrides.desktop_env) out["overrides"]["desktop_env"] = *env.overrides.desktop_env;
        if (env.overrides.window_manager) out["overrides"]["window_manager"] = *env.overrides.window_manager;
        std::println("{}", out.dump(2));
        return 0;
    }

    std::println("Distro:         {} {}", env.distro_id, env.distro_version);
    if (!env.variant_id.empty()) std::println("Variant:        {}", env.variant_id);
    std::println("Desktop:        {}{}", env.desktop_name(), env.overrides.desktop_env ? " (override)" : "");
    std::println("Session:        {}", to_string(env.session_type));
    std::println("Window manager: {}{}", env.window_manager, env.overrides.window_manager ? " (override)" : "");
    std::println("Adapter:        {}", adapter ? to_string(*adapter) : "none");
    return 0;
}

// Block until SIGINT/SIGTERM, printing every hub change as a JSON line.
static int watch(ContextClient& client) {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    int signal_fd = signalfd(-1, &mask, SFD_CLOEXEC);
    int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (signal_fd < 0 || epoll_fd < 0) {
        std::println(stderr, "watch setup failed: {}", std::strerror(errno));
        if (signal_fd >= 0) ::close(signal_fd);
        if (epoll_fd >= 0) ::close(epoll_fd);
        return 1;
    }

    epoll_event sig_ev{.events = EPOLLIN, .data = {.fd = signal_fd}};
    epoll_event client_ev{.events = EPOLLIN, .data = {.fd = client.event_fd()}};
    epoll_ctl(epoll_fd, EPOLL_CTL_ADD, signal_fd, &sig_ev);
    epoll_ctl(epoll_fd, EPOLL_CTL_ADD, client.event_fd(), &client_ev);

    client.hub().subscribe([](const HubSnapshot& snapshot) {
        std::println("{}", window_json(snapshot).dump());
        std::fflush(stdout);
    });
    std::println("{}", window_json(client.hub().snapshot()).dump());
    std::fflush(stdout);

    int rc = 0;
    bool running = true;
    while (running) {
        if (!client.process_events()) {
            std::println(stderr, "Lost connection");
            rc = 1;
            break;
        }

        epoll_event events[2];
        int n = epoll_wait(epoll_fd, events, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            rc = 1;
            break;
        }
        for (int i = 0; i < n; i++) {
            if (events[i].data.fd == signal_fd) running = false;
        }
    }

    ::close(epoll_fd);
    ::close(signal_fd);
    return rc;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string command;
    bool as_json = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty() && !arg.starts_with("-")) {
            command = arg;
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            usage(argv[0]);
            return 2;
        }
    }

    if (command != "env" && command != "current" && command != "watch") {
        if (!command.empty()) std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 2;
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    ProcfsSystemSource source;
    auto overrides = OverrideResolver(source).resolve(config.overrides);
    auto env = EnvironmentProbe(source).detect(overrides);
    auto adapter = select_adapter(env, config.wlroots_compositors);

    if (command == "env") {
        return print_env(env, adapter, as_json);
    }

    if (!env.wm_identified()) {
        std::println(stderr, "Configuration error: window manager not identified ({}).", env.window_manager);
        std::println(stderr, "Set WINCTX_WM_OVERRIDE or overrides.window_manager in the config file.");
        return 1;
    }
    if (!adapter) {
        std::println(stderr, "No adapter supports window manager '{}'", env.window_manager);
        return 1;
    }

    std::unique_ptr<ContextClient> client;
    if (*adapter == AdapterKind::X11) {
        client = std::make_unique<X11ContextClient>();
    } else {
        client = std::make_unique<DbusContextClient>(
            *adapter, std::chrono::milliseconds(config.dbus.call_timeout_ms));
    }

    if (auto res = client->connect(); !res) {
        std::println(stderr, "Failed to connect to the {} adapter: {}", to_string(*adapter), res.error());
        return 1;
    }

    if (command == "current") {
        auto snapshot = client->hub().snapshot();
        std::println("{}", window_json(snapshot).dump(as_json ? -1 : 2));
        return snapshot.alive ? 0 : 1;
    }

    return watch(*client);
}
