/*
 * streamcache/src/cache/connectivity_monitor.cpp
 *
 * ConnectivityMonitor: a co_spawn'ed poll loop on the owner's executor.
 * State shared with the coroutine lives in a shared_ptr so a loop that wakes after stop() (or
 * after the monitor is gone) only sees `running == false` and exits.
 *
 * InterfaceReachabilityProbe: reachable when a non-loopback interface is up, running and carries
 * an IPv4 or IPv6 address.
 */

#include <streamcache/cache/connectivity_monitor.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>

namespace streamcache::cache {

struct ConnectivityMonitor::Shared {
    std::shared_ptr<IReachabilityProbe> probe;
    std::chrono::milliseconds interval;
    Callback onChange;
    std::atomic<bool> running{false};

    mutable std::mutex mutex;
    std::optional<bool> last;

    // Record an observation; true when it differs from the previous one.
    bool observe(bool connected) {
        std::lock_guard<std::mutex> lk(mutex);
        if (last && *last == connected)
            return false;
        last = connected;
        return true;
    }
};

ConnectivityMonitor::ConnectivityMonitor(boost::asio::any_io_executor executor,
                                         std::shared_ptr<IReachabilityProbe> probe,
                                         std::chrono::milliseconds pollInterval,
                                         Callback onChange)
    : executor_(std::move(executor)), shared_(std::make_shared<Shared>()) {
    shared_->probe = std::move(probe);
    shared_->interval = pollInterval.count() > 0 ? pollInterval : std::chrono::milliseconds(1);
    shared_->onChange = std::move(onChange);
}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop();
}

void ConnectivityMonitor::start() {
    if (!shared_->probe) {
        spdlog::warn("[ConnectivityMonitor] No reachability probe; monitor disabled");
        return;
    }
    bool expected = false;
    if (!shared_->running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[ConnectivityMonitor] Already running, skipping start");
        return;
    }
    spdlog::debug("[ConnectivityMonitor] Starting (interval={}ms)", shared_->interval.count());
    launchPollLoop();
}

void ConnectivityMonitor::stop() {
    bool expected = true;
    if (!shared_->running.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }
    spdlog::debug("[ConnectivityMonitor] Stopping");
}

std::optional<bool> ConnectivityMonitor::isConnected() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->last;
}

void ConnectivityMonitor::noteConnectionLost() {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    shared_->last = false;
}

void ConnectivityMonitor::launchPollLoop() {
    auto shared = shared_;

    boost::asio::co_spawn(
        executor_,
        [shared]() -> boost::asio::awaitable<void> {
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(executor);

            while (shared->running.load(std::memory_order_acquire)) {
                const bool connected = shared->probe->isReachable();
                if (shared->observe(connected)) {
                    spdlog::info("[ConnectivityMonitor] Network {}",
                                 connected ? "reachable" : "unreachable");
                    if (shared->onChange)
                        shared->onChange(connected);
                }

                timer.expires_after(shared->interval);
                try {
                    co_await timer.async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted) {
                        break;
                    }
                    throw;
                }
            }

            spdlog::debug("[ConnectivityMonitor] Poll loop stopped");
            co_return;
        },
        boost::asio::detached);
}

// ---------- Interface based probe ----------

class InterfaceReachabilityProbe final : public IReachabilityProbe {
public:
    bool isReachable() override {
        struct ifaddrs* list = nullptr;
        if (::getifaddrs(&list) != 0) {
            spdlog::debug("[ConnectivityMonitor] getifaddrs failed: {}", std::strerror(errno));
            return false;
        }

        bool reachable = false;
        for (auto* it = list; it != nullptr && !reachable; it = it->ifa_next) {
            if (it->ifa_addr == nullptr)
                continue;
            const auto flags = it->ifa_flags;
            if ((flags & IFF_UP) == 0 || (flags & IFF_RUNNING) == 0 || (flags & IFF_LOOPBACK) != 0)
                continue;
            const auto family = it->ifa_addr->sa_family;
            reachable = family == AF_INET || family == AF_INET6;
        }
        ::freeifaddrs(list);
        return reachable;
    }
};

std::shared_ptr<IReachabilityProbe> makeInterfaceReachabilityProbe() {
    return std::make_shared<InterfaceReachabilityProbe>();
}

} // namespace streamcache::cache
