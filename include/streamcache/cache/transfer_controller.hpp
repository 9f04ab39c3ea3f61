#pragma once

#include <streamcache/cache/cache.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace streamcache::cache {

class BackingStore;

/**
 * Drives one resumable GET and persists what arrives.
 *
 * Each attempt runs the blocking transport on a worker thread owned by the controller. Received
 * bytes collect in an in-flight buffer that only the worker touches; it is appended to the
 * BackingStore whenever it reaches `downloadBufferFlushThreshold` and whenever the attempt ends.
 *
 * State machine: Idle -> Active -> {Completed | Failed | Suspended <-> Active}. Transient
 * connectivity loss suspends; every other error is terminal, deletes the backing file and fires
 * `onFailed`. Terminal events fire exactly once and nothing fires afterwards.
 *
 * Events are invoked on the worker thread (or on the caller of `cancel()`/`abort()`), never with
 * the controller lock held.
 */
class TransferController {
public:
    struct Events {
        std::function<void(const ContentInfo&)> onResponse;
        std::function<void(ByteSpan chunk)> onBytesReceived;
        std::function<void(const Error&)> onSuspended; // transient loss only
        // An attempt stopped by suspend() appended its in-flight tail to the store.
        std::function<void()> onFlushed;
        std::function<void()> onCompleted;
        std::function<void(const Error&)> onFailed;
    };

    TransferController(BackingStore& store, std::shared_ptr<IHttpTransport> transport,
                       CacheConfig config, Events events);
    ~TransferController();

    TransferController(const TransferController&) = delete;
    TransferController& operator=(const TransferController&) = delete;

    /**
     * Begin the transfer. With `resumeOffset > 0` the request carries
     * `Range: bytes=<resumeOffset>-`; the store must already hold [0, resumeOffset).
     */
    Expected<void> start(std::string url, std::uint64_t resumeOffset,
                         std::vector<Header> headers = {});

    // Pause without discarding progress. No effect unless active.
    void suspend();

    // Reissue the request from the persisted size. No effect unless suspended.
    void resume();

    // Explicit cancellation; always terminal (Failed/Cancelled).
    void cancel();

    // Terminal failure for a reason found outside the transfer (e.g. a store read error).
    void abort(Error reason);

    /**
     * Teardown: stop the worker and silence every event. Persisted bytes stay on disk so a later
     * session can resume from them.
     */
    void invalidate();

    [[nodiscard]] TransferState state() const;
    [[nodiscard]] std::optional<Error> failure() const;
    [[nodiscard]] std::uint64_t bytesReceived() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> expectedLength() const;
    [[nodiscard]] std::optional<ContentInfo> contentInfo() const;

private:
    struct Attempt;

    void launchLocked(std::uint64_t offset);
    void runAttempt(std::uint64_t generation, std::uint64_t offset);
    Expected<void> handleResponse(Attempt& attempt, const ResponseInfo& response);
    Expected<void> handleChunk(Attempt& attempt, ByteSpan chunk);
    Expected<void> flush(Attempt& attempt);
    std::optional<Error> verifyCompletedFile() const;

    void joinWorker(std::thread& worker);

    BackingStore& store_;
    std::shared_ptr<IHttpTransport> transport_;
    const CacheConfig config_;
    Events events_;

    mutable std::mutex mutex_;
    TransferState state_{TransferState::Idle};
    std::optional<Error> failure_;
    std::string url_;
    std::vector<Header> headers_;
    std::optional<ContentInfo> contentInfo_;
    std::optional<std::uint64_t> expectedLength_;
    std::thread worker_;
    bool bodyComplete_{false}; // a superseded attempt still received the whole body
    bool invalidated_{false};

    // Bumped by suspend/resume/cancel; an attempt whose generation is stale must stop.
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<std::uint64_t> bytesReceived_{0};
};

} // namespace streamcache::cache
