#pragma once

#include <streamcache/cache/cache.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace streamcache::cache {

/**
 * Observes network reachability by polling an IReachabilityProbe on an asio executor and
 * reports `connectivityChanged(connected)` on every transition. Repeated identical observations
 * are suppressed; the first observation always counts as a transition.
 *
 * The callback runs on the executor.
 */
class ConnectivityMonitor {
public:
    using Callback = std::function<void(bool connected)>;

    ConnectivityMonitor(boost::asio::any_io_executor executor,
                        std::shared_ptr<IReachabilityProbe> probe,
                        std::chrono::milliseconds pollInterval, Callback onChange);
    ~ConnectivityMonitor();

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    void start();
    void stop();

    /**
     * Last observed state; empty before the first poll.
     */
    [[nodiscard]] std::optional<bool> isConnected() const;

    /**
     * Record that a transfer just observed the network going away. The next poll that finds the
     * path reachable reports `connected` again.
     */
    void noteConnectionLost();

private:
    struct Shared;

    void launchPollLoop();

    boost::asio::any_io_executor executor_;
    std::shared_ptr<Shared> shared_;
};

} // namespace streamcache::cache
