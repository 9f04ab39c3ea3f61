/*
 * streamcache/src/cache/request_fulfiller.cpp
 *
 * Fulfillment passes:
 * - Snapshot the pending set under the set lock, then release it
 * - Per request: claim its delivery flag, read at most maxInMemoryReadChunk per copy from the
 *   store, hand the slice to the delegate, repeat until the persisted bytes run out
 * - A request leaves the set once every requested byte was delivered
 * - drain/rejectAll only mark the ending of each request under the set lock; delivering the
 *   ending goes through the same claim, so a pass started from inside a delegate never blocks
 *   on the request that is calling it
 */

#include <streamcache/cache/backing_store.hpp>
#include <streamcache/cache/request_fulfiller.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace streamcache::cache {

RequestFulfiller::RequestFulfiller(BackingStore& store, std::size_t maxInMemoryReadChunk)
    : store_(store), maxChunk_(std::max<std::size_t>(maxInMemoryReadChunk, 1)) {}

ReadHandle RequestFulfiller::add(std::uint64_t offset, std::uint64_t length,
                                 ReadDelegate delegate) {
    auto request = std::make_shared<ReadRequest>();
    request->offset = offset;
    request->length = length;
    request->nextOffset = offset;
    request->delegate = std::move(delegate);

    std::lock_guard<std::mutex> lk(mutex_);
    request->handle = nextHandle_++;
    pending_.emplace(request->handle, request);
    spdlog::debug("[RequestFulfiller] Queued read #{} offset={} length={}", request->handle,
                  offset, length == kToEndOfResource ? std::string("eof") : std::to_string(length));
    return request->handle;
}

bool RequestFulfiller::cancel(ReadHandle handle) {
    std::shared_ptr<ReadRequest> request;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = pending_.find(handle);
        if (it == pending_.end())
            return false;
        request = std::move(it->second);
        pending_.erase(it);
    }
    request->cancelled.store(true, std::memory_order_release);
    spdlog::debug("[RequestFulfiller] Cancelled read #{}", handle);
    return true;
}

std::size_t RequestFulfiller::pendingCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

std::vector<std::shared_ptr<ReadRequest>> RequestFulfiller::snapshot() const {
    std::vector<std::shared_ptr<ReadRequest>> out;
    std::lock_guard<std::mutex> lk(mutex_);
    out.reserve(pending_.size());
    for (const auto& [handle, request] : pending_)
        out.push_back(request);
    return out;
}

void RequestFulfiller::erase(ReadHandle handle) {
    std::lock_guard<std::mutex> lk(mutex_);
    pending_.erase(handle);
}

Expected<bool> RequestFulfiller::serve(ReadRequest& request) {
    const auto end = request.end();
    while (request.nextOffset < end) {
        if (request.cancelled.load(std::memory_order_acquire))
            return false;

        const auto persisted = store_.size();
        if (persisted <= request.nextOffset)
            return false; // no data yet at this offset

        const auto available = persisted - request.nextOffset;
        const auto deliverable = std::min<std::uint64_t>(
            {available, end - request.nextOffset, static_cast<std::uint64_t>(maxChunk_)});

        auto data = store_.read(request.nextOffset, deliverable);
        if (!data.ok()) {
            if (data.error().code == ErrorCode::OutOfRange)
                return false;
            return data.error();
        }
        const auto& bytes = data.value();
        if (bytes.empty())
            return false;

        if (request.delegate.onData)
            request.delegate.onData(request.nextOffset, ByteSpan(bytes.data(), bytes.size()));
        request.nextOffset += bytes.size();
    }
    return true;
}

Expected<void> RequestFulfiller::settle(ReadRequest& request) {
    request.recheck.store(true);
    while (request.recheck.load()) {
        bool expected = false;
        if (!request.delivering.compare_exchange_strong(expected, true))
            return Expected<void>{}; // the delivering pass sees recheck once it lets go
        request.recheck.store(false);

        auto settled = settleLocked(request);
        request.delivering.store(false);
        if (!settled.ok())
            return settled.error();
    }
    return Expected<void>{};
}

Expected<void> RequestFulfiller::settleLocked(ReadRequest& request) {
    if (request.done || request.cancelled.load(std::memory_order_acquire))
        return Expected<void>{};

    ReadRequest::Ending ending;
    std::optional<Error> rejection;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ending = request.ending;
        rejection = request.rejection;
    }

    if (ending == ReadRequest::Ending::Rejected) {
        request.done = true;
        if (request.delegate.onFailed)
            request.delegate.onFailed(
                rejection.value_or(Error{ErrorCode::Cancelled, "read rejected"}));
        return Expected<void>{};
    }

    auto served = serve(request);
    if (!served.ok()) {
        if (ending == ReadRequest::Ending::AtEndOfResource) {
            request.done = true;
            if (request.delegate.onFailed)
                request.delegate.onFailed(served.error());
        }
        return served.error();
    }
    if (request.cancelled.load(std::memory_order_acquire))
        return Expected<void>{};

    if (served.value()) {
        request.done = true;
        erase(request.handle);
        spdlog::debug("[RequestFulfiller] Read #{} fulfilled ({} bytes)", request.handle,
                      request.nextOffset - request.offset);
        if (request.delegate.onFinished)
            request.delegate.onFinished();
        return Expected<void>{};
    }
    if (ending == ReadRequest::Ending::Open)
        return Expected<void>{};

    // No more bytes will ever come.
    request.done = true;
    const auto finalSize = store_.size();
    if (request.length == kToEndOfResource && request.offset <= finalSize) {
        if (request.delegate.onFinished)
            request.delegate.onFinished();
        return Expected<void>{};
    }
    if (request.delegate.onFailed) {
        request.delegate.onFailed(Error{
            ErrorCode::OutOfRange, "requested range [" + std::to_string(request.offset) + ", " +
                                       std::to_string(request.end()) +
                                       ") extends beyond resource size " +
                                       std::to_string(finalSize)});
    }
    return Expected<void>{};
}

Expected<void> RequestFulfiller::fulfill() {
    for (const auto& request : snapshot()) {
        if (auto r = settle(*request); !r.ok())
            return r.error();
    }
    return Expected<void>{};
}

Expected<void> RequestFulfiller::drain() {
    std::vector<std::shared_ptr<ReadRequest>> remaining;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        remaining.reserve(pending_.size());
        for (auto& [handle, request] : pending_) {
            request->ending = ReadRequest::Ending::AtEndOfResource;
            remaining.push_back(std::move(request));
        }
        pending_.clear();
    }

    Expected<void> result;
    for (const auto& request : remaining) {
        auto r = settle(*request);
        if (!r.ok() && result.ok())
            result = r.error();
    }
    return result;
}

void RequestFulfiller::rejectAll(const Error& error) {
    std::vector<std::shared_ptr<ReadRequest>> rejected;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        rejected.reserve(pending_.size());
        for (auto& [handle, request] : pending_) {
            request->ending = ReadRequest::Ending::Rejected;
            request->rejection = error;
            rejected.push_back(std::move(request));
        }
        pending_.clear();
    }
    if (!rejected.empty()) {
        spdlog::debug("[RequestFulfiller] Rejecting {} pending read(s): {}", rejected.size(),
                      error.message);
    }
    for (const auto& request : rejected) {
        if (auto r = settle(*request); !r.ok()) {
            spdlog::warn("[RequestFulfiller] Rejecting read #{} failed: {}", request->handle,
                         r.error().message);
        }
    }
}

} // namespace streamcache::cache
