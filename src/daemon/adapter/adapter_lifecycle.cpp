#include "adapter/adapter_lifecycle.hpp"

#include <format>
#include <print>

std::string_view to_string(AdapterStateKind kind) {
    switch (kind) {
        case AdapterStateKind::Starting: return "starting";
        case AdapterStateKind::Active: return "active";
        case AdapterStateKind::SelfTerminated: return "self-terminated";
        case AdapterStateKind::Failed: return "failed";
    }
    return "unknown";
}

GateOutcome gate_adapter(AdapterKind kind, const EnvironmentInfo& env,
                         const std::vector<std::string>& extra_wlroots) {
    if (!env.wm_identified()) return GateOutcome::Unresolved;
    auto selected = select_adapter(env, extra_wlroots);
    return selected == kind ? GateOutcome::Proceed : GateOutcome::Mismatch;
}

AdapterLifecycle::AdapterLifecycle(AdapterKind kind, bool required)
    : kind_(kind), required_(required) {}

const AdapterState& AdapterLifecycle::evaluate(const EnvironmentInfo& env,
                                               const std::vector<std::string>& extra_wlroots) {
    if (state_.kind != AdapterStateKind::Starting) {
        std::println(stderr, "lifecycle: cannot evaluate, state is {}", to_string(state_.kind));
        return state_;
    }

    switch (gate_adapter(kind_, env, extra_wlroots)) {
        case GateOutcome::Proceed:
            state_.kind = AdapterStateKind::Active;
            break;

        case GateOutcome::Mismatch: {
            auto selected = select_adapter(env, extra_wlroots);
            auto reason = selected
                ? std::format("window manager {} is served by the {} adapter",
                              env.window_manager, to_string(*selected))
                : std::format("window manager {} has no adapter", env.window_manager);
            finish(AdapterStateKind::SelfTerminated, std::move(reason));
            break;
        }

        case GateOutcome::Unresolved:
            if (required_) {
                finish(AdapterStateKind::Failed,
                       std::format("window manager could not be identified ({})",
                                   env.window_manager));
            } else {
                finish(AdapterStateKind::SelfTerminated, "window manager could not be identified");
            }
            break;
    }

    return state_;
}

bool AdapterLifecycle::fail(std::string error) {
    return finish(AdapterStateKind::Failed, std::move(error));
}

bool AdapterLifecycle::self_terminate(std::string reason) {
    return finish(AdapterStateKind::SelfTerminated, std::move(reason));
}

int AdapterLifecycle::exit_code() const {
    return state_.kind == AdapterStateKind::Failed ? 1 : 0;
}

bool AdapterLifecycle::finish(AdapterStateKind kind, std::string reason) {
    if (state_.terminal()) return false;
    state_.kind = kind;
    state_.reason = std::move(reason);
    return true;
}
