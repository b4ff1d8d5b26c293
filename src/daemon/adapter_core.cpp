#include "adapter_core.hpp"

#include <format>
#include <print>

AdapterCore::AdapterCore(AdapterKind kind, const Config& config, bool required, bool verbose,
                         ContextBackend& backend, ContextService& service, WindowContextHub& hub,
                         ArmRetry arm_retry)
    : kind_(kind), config_(config), verbose_(verbose),
      backend_(backend), service_(service), hub_(hub),
      arm_retry_(std::move(arm_retry)),
      lifecycle_(kind, required),
      retry_(static_cast<int>(config.retry.max_attempts),
             std::chrono::milliseconds(config.retry.initial_delay_ms),
             std::chrono::milliseconds(config.retry.max_delay_ms)) {
    backend_.set_listener([this](std::optional<WindowContext> ctx) {
        on_backend_context(std::move(ctx));
    });
    hub_subscription_ = hub_.subscribe([this](const HubSnapshot& snapshot) {
        on_hub_change(snapshot);
    });
}

AdapterCore::~AdapterCore() {
    hub_.unsubscribe(hub_subscription_);
    backend_.set_listener(nullptr);
}

const AdapterState& AdapterCore::start(const EnvironmentInfo& env) {
    const auto& state = lifecycle_.evaluate(env, config_.wlroots_compositors);
    service_.set_state(state);

    switch (state.kind) {
        case AdapterStateKind::SelfTerminated:
            // Another adapter serves this session. Not an error.
            log(std::format("{} adapter not needed: {}", to_string(kind_), state.reason));
            return state;
        case AdapterStateKind::Failed:
            std::println(stderr, "[winctx] {} adapter: {}", to_string(kind_), state.reason);
            return state;
        case AdapterStateKind::Starting:
        case AdapterStateKind::Active:
            break;
    }

    log(std::format("{} adapter active (window manager {})", to_string(kind_), env.window_manager));

    if (auto res = service_.start(); !res) {
        fail(std::format("cannot publish {} adapter on the session bus: {}",
                         to_string(kind_), res.error()));
        return lifecycle_.state();
    }

    connect_backend();
    return lifecycle_.state();
}

void AdapterCore::on_backend_readable() {
    if (!backend_connected_) return;
    if (auto res = backend_.dispatch(); !res) handle_backend_error(res.error());
}

void AdapterCore::on_poll_tick() {
    if (!backend_connected_) return;
    if (auto res = backend_.poll(); !res) handle_backend_error(res.error());
}

void AdapterCore::on_retry_timer() {
    if (!lifecycle_.active() || backend_connected_) return;
    connect_backend();
}

void AdapterCore::on_bus_lost() {
    fail("session bus connection lost");
}

void AdapterCore::shutdown() {
    if (lifecycle_.self_terminate("stopped")) {
        log("Shutting down");
        service_.set_state(lifecycle_.state());
    }
    release();
}

void AdapterCore::connect_backend() {
    auto res = backend_.connect();
    if (!res) {
        handle_backend_error(res.error());
        return;
    }

    backend_connected_ = true;
    ++backend_generation_;
    retry_.reset();
    hub_.mark_alive();
    log(std::format("Connected to {}", expected_backend(kind_)));
}

void AdapterCore::handle_backend_error(const BackendError& error) {
    backend_.disconnect();
    backend_connected_ = false;
    hub_.mark_stale();

    if (!error.transient_error()) {
        fail(std::format("{} unavailable: {}", expected_backend(kind_), error.message));
        return;
    }

    auto delay = retry_.next_delay();
    if (!delay) {
        fail(std::format("{} unreachable after {} attempts: {}",
                         expected_backend(kind_), retry_.attempts(), error.message));
        return;
    }

    std::println(stderr, "[winctx] {} (retrying in {} ms)", error.message, delay->count());
    arm_retry_(*delay);
}

void AdapterCore::on_backend_context(std::optional<WindowContext> ctx) {
    if (!lifecycle_.active()) return;

    if (ctx) {
        log(std::format("Focus: {} ({})", ctx->app_id, ctx->window_title));
        hub_.publish(std::move(*ctx));
    } else {
        log("Focus: none");
        hub_.clear();
    }
}

void AdapterCore::on_hub_change(const HubSnapshot& snapshot) {
    if (!snapshot.alive) {
        service_.publish_stale();
        return;
    }
    service_.publish(snapshot.context);
}

void AdapterCore::fail(std::string error) {
    if (!lifecycle_.fail(std::move(error))) return;
    std::println(stderr, "[winctx] {} adapter failed: {}", to_string(kind_), lifecycle_.state().reason);
    service_.set_state(lifecycle_.state());
    release();
}

void AdapterCore::release() {
    if (released_) return;
    released_ = true;

    if (backend_connected_) {
        backend_.disconnect();
        backend_connected_ = false;
    }
    hub_.mark_stale();
    service_.stop();
}

void AdapterCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[winctx] {}", msg);
    }
}
