#include "adapter/adapter_kind.hpp"
#include "config.hpp"
#include "env/environment_probe.hpp"
#include "env/override_resolver.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/procfs_system_source.hpp"

#include <optional>
#include <print>
#include <string>

static void print_usage() {
    std::println("Usage: winctx-adapter --adapter gnome|kwin|cosmic|wlroots [options]");
    std::println("Options:");
    std::println("  -a, --adapter NAME  Adapter to run");
    std::println("  -r, --require       Fail instead of exiting when the environment is unidentified");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool required = false;
    std::string adapter_name;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--adapter" || arg == "-a") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} requires an argument", arg);
                return 2;
            }
            adapter_name = argv[++i];
        } else if (arg == "--require" || arg == "-r") {
            required = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} requires an argument", arg);
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage();
            return 2;
        }
    }

    auto kind = parse_adapter_kind(adapter_name);
    if (!kind || *kind == AdapterKind::X11) {
        // X11 tracking runs inside the consumer and has no bus service.
        std::println(stderr, "Unknown adapter '{}', expected gnome, kwin, cosmic or wlroots",
                     adapter_name);
        return 2;
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    ProcfsSystemSource source;
    auto overrides = OverrideResolver(source).resolve(config.overrides);
    auto env = EnvironmentProbe(source).detect(overrides);

    if (verbose) {
        std::println(stderr, "[winctx] Environment: distro={} {} de={} session={} wm={}",
                     env.distro_id, env.distro_version, env.desktop_name(),
                     to_string(env.session_type), env.window_manager);
    }

    LinuxEventLoop loop(std::move(config), *kind, required, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    return loop.run(env);
}
