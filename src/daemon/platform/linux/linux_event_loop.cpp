#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/backend_factory.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

itimerspec to_itimerspec(std::chrono::milliseconds value, std::chrono::milliseconds interval) {
    auto split = [](std::chrono::milliseconds ms) {
        return timespec{
            .tv_sec = static_cast<time_t>(ms.count() / 1000),
            .tv_nsec = static_cast<long>((ms.count() % 1000) * 1000000),
        };
    };
    return {.it_interval = split(interval), .it_value = split(value)};
}

void drain(int fd) {
    uint64_t expirations;
    while (::read(fd, &expirations, sizeof(expirations)) > 0) {
    }
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, AdapterKind kind, bool required, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      service_(bus_, kind, hub_),
      backend_(make_backend(kind, config_, bus_, service_)),
      core_(std::make_unique<AdapterCore>(
          kind, config_, required, verbose_, *backend_, service_, hub_,
          [this](std::chrono::milliseconds delay) { arm_retry(delay); })) {}

LinuxEventLoop::~LinuxEventLoop() {
    // Release the bus name and protocol bindings before the fds go away.
    core_.reset();
    backend_.reset();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (poll_timer_fd_ >= 0) ::close(poll_timer_fd_);
    if (retry_timer_fd_ >= 0) ::close(retry_timer_fd_);
}

bool LinuxEventLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    poll_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    retry_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (poll_timer_fd_ < 0 || retry_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    if (!add_fd(signal_fd_) || !add_fd(poll_timer_fd_) || !add_fd(retry_timer_fd_)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

int LinuxEventLoop::run(const EnvironmentInfo& env) {
    core_->start(env);
    if (core_->finished()) return core_->exit_code();

    if (auto interval = backend_->poll_interval(); interval.count() > 0) {
        arm_poll(interval);
    }

    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed) && !core_->finished()) {
        // libdbus and libwayland may hold queued input that no longer shows
        // up as fd readiness; drain it before blocking.
        if (!bus_.dispatch() && bus_.raw()) {
            core_->on_bus_lost();
            break;
        }
        if (core_->backend_connected()) backend_->flush();
        if (core_->finished()) break;
        sync_fds();

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && !core_->finished(); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == poll_timer_fd_) {
                drain(poll_timer_fd_);
                core_->on_poll_tick();
                continue;
            }

            if (fd == retry_timer_fd_) {
                drain(retry_timer_fd_);
                core_->on_retry_timer();
                continue;
            }

            if (fd == bus_fd_) {
                if (!bus_.dispatch()) core_->on_bus_lost();
                continue;
            }

            if (fd == backend_fd_) {
                core_->on_backend_readable();
                continue;
            }
        }
    }

    // Clean shutdown
    core_->shutdown();
    return core_->exit_code();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::sync_fds() {
    if (bus_fd_ < 0 && bus_.fd() >= 0) {
        bus_fd_ = bus_.fd();
        add_fd(bus_fd_);
    }

    int fd = core_->backend_connected() ? backend_->event_fd() : -1;
    if (fd == backend_fd_ && core_->backend_generation() == backend_generation_) return;

    // A closed fd leaves the epoll set on its own; the DEL may fail harmlessly.
    if (backend_fd_ >= 0 && backend_fd_ != bus_fd_) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, backend_fd_, nullptr);
    }
    backend_fd_ = -1;
    backend_generation_ = core_->backend_generation();

    if (fd >= 0 && fd != bus_fd_) {
        if (add_fd(fd)) {
            backend_fd_ = fd;
        } else {
            std::println(stderr, "[winctx] cannot watch backend fd: {}", std::strerror(errno));
        }
    }
}

void LinuxEventLoop::arm_retry(std::chrono::milliseconds delay) {
    auto spec = to_itimerspec(delay, std::chrono::milliseconds{0});
    if (timerfd_settime(retry_timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::arm_poll(std::chrono::milliseconds interval) {
    auto spec = to_itimerspec(interval, interval);
    if (timerfd_settime(poll_timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

bool LinuxEventLoop::add_fd(int fd) {
    epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
    return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[winctx] {}", msg);
    }
}
