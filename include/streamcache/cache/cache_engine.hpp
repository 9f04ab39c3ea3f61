#pragma once

#include <streamcache/cache/cache.hpp>
#include <streamcache/cache/request_fulfiller.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamcache::cache {

class BackingStore;
class ConnectivityMonitor;
class TransferController;

/**
 * Progressive download cache for one URL / backing file pair.
 *
 * Owns the BackingStore, TransferController, RequestFulfiller and ConnectivityMonitor and wires
 * their events together:
 *  - bytes arriving from the transfer trigger a fulfillment pass and a progress event
 *  - connectivity transitions suspend or resume the transfer
 *  - completion drains the pending reads, failure rejects them
 *
 * The transfer starts lazily with the first read request, resuming from whatever the backing
 * file already holds. Reads may be submitted from any thread.
 */
class CacheEngine {
public:
    struct Options {
        std::string url;
        std::filesystem::path filePath;
        std::vector<Header> headers;
        CacheConfig config{};
    };

    // Observer callbacks. None fires after onCompleted/onFailed; destruction emits nothing.
    struct Events {
        std::function<void(const ProgressEvent&)> onProgress;
        std::function<void(const std::filesystem::path&)> onCompleted;
        std::function<void(const Error&)> onFailed;
        std::function<void(bool connected)> onConnectivityChanged;
    };

    /**
     * Open the backing file and start observing connectivity. A null transport selects libcurl,
     * a null probe the network-interface probe.
     */
    static Expected<std::unique_ptr<CacheEngine>>
    open(Options options, Events events, std::shared_ptr<IHttpTransport> transport = nullptr,
         std::shared_ptr<IReachabilityProbe> probe = nullptr);

    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    /**
     * Queue a byte-range read and run one fulfillment pass. `length` may be kToEndOfResource.
     * The delegate receives the bytes in order and then exactly one of onFinished / onFailed.
     */
    ReadHandle submitReadRequest(std::uint64_t offset, std::uint64_t length, ReadDelegate delegate);

    // Withdraw a pending read; its delegate is not called again.
    bool cancelReadRequest(ReadHandle handle);

    [[nodiscard]] ProgressEvent currentProgress() const;

    /**
     * Abandon the session: stop the transfer, delete the backing file, reject pending reads and
     * fire onFailed(Cancelled). No effect once completed or failed.
     */
    void cancel();

    /**
     * Remove the backing file unless the download completed. Used when an unfinished download
     * must not be kept around (e.g. on shutdown); an unfinished transfer is cancelled first.
     */
    Expected<void> discardPartialFile();

    [[nodiscard]] std::optional<ContentInfo> contentInfo() const;
    [[nodiscard]] TransferState state() const;
    [[nodiscard]] std::optional<bool> isConnected() const;
    [[nodiscard]] const std::filesystem::path& filePath() const;

private:
    struct Runtime;

    CacheEngine(Options options, Events events, std::unique_ptr<BackingStore> store,
                std::shared_ptr<IHttpTransport> transport,
                std::shared_ptr<IReachabilityProbe> probe);

    void startTransferOnce();
    void runFulfillment();

    void handleBytesReceived();
    void handleSuspended();
    void handleCompleted();
    void handleFailed(const Error& error);
    void handleConnectivity(bool connected);

    // True for the caller that moved the session into its terminal state.
    bool enterTerminal();

    const Options options_;
    const Events events_;

    std::unique_ptr<BackingStore> store_;
    std::unique_ptr<RequestFulfiller> fulfiller_;
    std::unique_ptr<TransferController> transfer_;
    std::unique_ptr<Runtime> runtime_; // io_context + thread + ConnectivityMonitor

    std::atomic<bool> started_{false};
    std::atomic<bool> terminal_{false};
    std::atomic<bool> silenced_{false};
};

} // namespace streamcache::cache
