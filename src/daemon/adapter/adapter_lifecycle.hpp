#pragma once

#include "adapter/adapter_kind.hpp"
#include "env/environment_info.hpp"

#include <string>
#include <string_view>
#include <vector>

enum class AdapterStateKind { Starting, Active, SelfTerminated, Failed };

std::string_view to_string(AdapterStateKind kind);

struct AdapterState {
    AdapterStateKind kind = AdapterStateKind::Starting;
    std::string reason;  // why SelfTerminated or Failed, empty otherwise

    bool terminal() const {
        return kind == AdapterStateKind::SelfTerminated || kind == AdapterStateKind::Failed;
    }
};

enum class GateOutcome {
    Proceed,     // the environment calls for this adapter
    Mismatch,    // it calls for another adapter, or one that does not exist
    Unresolved,  // window manager is the sentinel
};

GateOutcome gate_adapter(AdapterKind kind, const EnvironmentInfo& env,
                         const std::vector<std::string>& extra_wlroots = {});

// Startup gate and terminal states of one adapter process. Transitions only
// go forward; a restart is a new process with a new lifecycle.
class AdapterLifecycle {
public:
    // `required` marks an adapter selected explicitly by the user or the
    // supervisor: an unidentified environment is then fatal instead of benign.
    AdapterLifecycle(AdapterKind kind, bool required);

    // Starting -> Active | SelfTerminated | Failed. No-op in any other state.
    const AdapterState& evaluate(const EnvironmentInfo& env,
                                 const std::vector<std::string>& extra_wlroots = {});

    // Starting or Active -> Failed. Returns false if already terminal.
    bool fail(std::string error);

    // Starting or Active -> SelfTerminated, used on an orderly shutdown.
    bool self_terminate(std::string reason);

    const AdapterState& state() const { return state_; }
    AdapterKind kind() const { return kind_; }
    bool active() const { return state_.kind == AdapterStateKind::Active; }

    // 1 for Failed, 0 otherwise.
    int exit_code() const;

private:
    bool finish(AdapterStateKind kind, std::string reason);

    AdapterKind kind_;
    bool required_;
    AdapterState state_;
};
