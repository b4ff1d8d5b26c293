#pragma once

#include "platform/context_backend.hpp"
#include "platform/context_service.hpp"
#include "platform/system_source.hpp"

#include <map>
#include <string>
#include <vector>

// SystemSource backed by plain containers.
class FakeSystemSource : public SystemSource {
public:
    std::map<std::string, std::string> vars;
    std::map<std::string, std::string> files;
    std::vector<ProcessEntry> procs;

    std::optional<std::string> env(const std::string& name) const override {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> read_file(const std::string& path) const override {
        auto it = files.find(path);
        if (it == files.end()) return std::nullopt;
        return it->second;
    }

    bool file_exists(const std::string& path) const override { return files.contains(path); }

    std::vector<ProcessEntry> processes() const override { return procs; }

    void add_process(const std::string& comm) {
        procs.push_back({static_cast<int>(procs.size()) + 100, comm});
    }
};

// Backend whose connection results are scripted by the test.
class FakeBackend : public ContextBackend {
public:
    explicit FakeBackend(AdapterKind kind) : kind_(kind) {}

    AdapterKind kind() const override { return kind_; }

    std::expected<void, BackendError> connect() override {
        ++connect_calls;
        if (!connect_results.empty()) {
            auto result = connect_results.front();
            connect_results.erase(connect_results.begin());
            if (!result) return result;
        }
        connected = true;
        return {};
    }

    void disconnect() override { connected = false; }

    std::expected<void, BackendError> dispatch() override {
        if (dispatch_error) return std::unexpected(*dispatch_error);
        return {};
    }

    void focus(WindowContext ctx) { emit(std::move(ctx)); }
    void unfocus() { emit(std::nullopt); }

    std::vector<std::expected<void, BackendError>> connect_results;
    std::optional<BackendError> dispatch_error;
    int connect_calls = 0;
    bool connected = false;

private:
    AdapterKind kind_;
};

// Records what an adapter would have put on the bus.
class FakeService : public ContextService {
public:
    std::expected<void, std::string> start() override {
        if (start_error) return std::unexpected(*start_error);
        started = true;
        return {};
    }

    void stop() override { started = false; }

    void publish(const std::optional<WindowContext>& ctx) override { published.push_back(ctx); }

    void publish_stale() override { ++stale_notices; }

    void set_state(const AdapterState& state) override { states.push_back(state.kind); }

    std::optional<std::string> start_error;
    bool started = false;
    std::vector<std::optional<WindowContext>> published;
    std::vector<AdapterStateKind> states;
    int stale_notices = 0;
};

inline WindowContext make_context(const std::string& app_id, const std::string& title = {}) {
    WindowContext ctx;
    ctx.app_id = app_id;
    ctx.app_class = app_id;
    ctx.window_title = title;
    ctx.observed_at = std::chrono::steady_clock::now();
    ctx.source_adapter = "test";
    return ctx;
}
