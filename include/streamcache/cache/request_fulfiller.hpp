#pragma once

#include <streamcache/cache/cache.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace streamcache::cache {

class BackingStore;

using ReadHandle = std::uint64_t;

/**
 * Delivery handle of a byte-range read. `onData` receives consecutive slices starting at the
 * requested offset; exactly one of `onFinished` / `onFailed` ends the request, unless it is
 * cancelled first.
 */
struct ReadDelegate {
    std::function<void(std::uint64_t offset, ByteSpan data)> onData;
    std::function<void()> onFinished;
    std::function<void(const Error&)> onFailed;
};

/**
 * One outstanding byte-range read.
 */
struct ReadRequest {
    // How a request that left the pending set must end.
    enum class Ending { Open, AtEndOfResource, Rejected };

    ReadHandle handle{0};
    std::uint64_t offset{0};
    std::uint64_t length{0}; // kToEndOfResource = until the resource ends
    ReadDelegate delegate;

    // Next byte to deliver; only touched by the pass that holds `delivering`.
    std::uint64_t nextOffset{0};
    bool done{false};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> delivering{false};
    // Set by a pass that found the request busy; the busy pass settles it again.
    std::atomic<bool> recheck{false};

    // Guarded by the fulfiller's set mutex.
    Ending ending{Ending::Open};
    std::optional<Error> rejection;

    [[nodiscard]] std::uint64_t end() const noexcept {
        if (length == kToEndOfResource || offset > kToEndOfResource - length)
            return kToEndOfResource;
        return offset + length;
    }
};

/**
 * Matches pending reads against the bytes persisted in a BackingStore.
 *
 * The pending set has its own mutex; it is never held while reading the store or while calling a
 * delegate. One pass at a time delivers to a request. A pass that finds the request busy leaves
 * it to the busy pass instead of waiting, so a delegate may call back into the fulfiller (add a
 * read, run a pass, drain or reject) from inside `onData`.
 */
class RequestFulfiller {
public:
    RequestFulfiller(BackingStore& store, std::size_t maxInMemoryReadChunk);

    RequestFulfiller(const RequestFulfiller&) = delete;
    RequestFulfiller& operator=(const RequestFulfiller&) = delete;

    ReadHandle add(std::uint64_t offset, std::uint64_t length, ReadDelegate delegate);

    /**
     * Withdraw a pending request. Returns false when the handle is unknown (already finished,
     * failed or cancelled). No delegate callback fires for it afterwards.
     */
    bool cancel(ReadHandle handle);

    /**
     * One fulfillment pass over every pending request against the current store size.
     * A store read failure stops the pass and is returned to the caller.
     */
    Expected<void> fulfill();

    /**
     * Final pass once the resource is complete: deliver what exists, finish to-end requests and
     * fail the rest with OutOfRange since no more bytes will ever come.
     */
    Expected<void> drain();

    /**
     * Fail every pending request with `error` and clear the set.
     */
    void rejectAll(const Error& error);

    [[nodiscard]] std::size_t pendingCount() const;

private:
    // Run settleLocked() for `request` unless another pass is delivering to it.
    Expected<void> settle(ReadRequest& request);
    // Deliver what the store holds, then end the request if its ending says so.
    Expected<void> settleLocked(ReadRequest& request);
    // Deliver as much of `request` as the store holds; true when the request is done.
    Expected<bool> serve(ReadRequest& request);
    std::vector<std::shared_ptr<ReadRequest>> snapshot() const;
    void erase(ReadHandle handle);

    BackingStore& store_;
    const std::size_t maxChunk_;

    std::unordered_map<ReadHandle, std::shared_ptr<ReadRequest>> pending_;
    ReadHandle nextHandle_{1};
    mutable std::mutex mutex_;
};

} // namespace streamcache::cache
