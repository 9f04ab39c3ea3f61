/*
 * streamcache/src/cache/transfer_controller.cpp
 *
 * TransferController:
 * - One worker thread per attempt runs IHttpTransport::fetch to completion
 * - Attempts are tagged with a generation; suspend/cancel/teardown bump it, which makes the
 *   running attempt's shouldCancel() true and silences its remaining callbacks
 * - The attempt epilogue flushes the in-flight buffer, then decides the outcome under the lock:
 *   completed (after size verification), suspended (transient loss) or failed (file deleted)
 * - A resumed request that the server answers with 200 has its first resumeOffset body bytes
 *   dropped, keeping the backing file the in-order concatenation of the resource
 */

#include <streamcache/cache/backing_store.hpp>
#include <streamcache/cache/transfer_controller.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace streamcache::cache {

namespace {

bool isTerminal(TransferState s) {
    return s == TransferState::Completed || s == TransferState::Failed;
}

} // namespace

struct TransferController::Attempt {
    std::uint64_t generation{0};
    std::uint64_t offset{0};
    std::uint64_t skip{0}; // body bytes to drop before the first persisted byte
    bool satisfied{false}; // 416 for a range starting exactly at the end of the resource
    std::vector<std::byte> buffer;
};

TransferController::TransferController(BackingStore& store,
                                       std::shared_ptr<IHttpTransport> transport,
                                       CacheConfig config, Events events)
    : store_(store), transport_(std::move(transport)), config_(std::move(config)),
      events_(std::move(events)) {}

TransferController::~TransferController() {
    invalidate();
}

Expected<void> TransferController::start(std::string url, std::uint64_t resumeOffset,
                                         std::vector<Header> headers) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "TransferController.start: empty url"};
    }
    if (!transport_) {
        return Error{ErrorCode::InvalidArgument, "TransferController.start: no transport"};
    }
    const auto persisted = store_.size();
    if (resumeOffset != persisted) {
        return Error{ErrorCode::InvalidArgument,
                     "resume offset " + std::to_string(resumeOffset) +
                         " does not match persisted size " + std::to_string(persisted)};
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (invalidated_ || state_ != TransferState::Idle) {
        return Error{ErrorCode::InvalidArgument, std::string("transfer cannot start while ") +
                                                     transferStateName(state_)};
    }
    url_ = std::move(url);
    headers_ = std::move(headers);
    state_ = TransferState::Active;
    spdlog::info("[TransferController] Starting {} at offset {}", url_, resumeOffset);
    launchLocked(resumeOffset);
    return Expected<void>{};
}

void TransferController::launchLocked(std::uint64_t offset) {
    const auto generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    bytesReceived_.store(offset, std::memory_order_release);
    worker_ = std::thread([this, generation, offset] { runAttempt(generation, offset); });
}

void TransferController::suspend() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (invalidated_ || state_ != TransferState::Active)
        return;
    state_ = TransferState::Suspended;
    generation_.fetch_add(1, std::memory_order_acq_rel);
    spdlog::info("[TransferController] Suspended at {} bytes",
                 bytesReceived_.load(std::memory_order_acquire));
}

void TransferController::resume() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (invalidated_ || state_ != TransferState::Suspended)
            return;
        state_ = TransferState::Active;
        previous = std::move(worker_);
    }

    // The previous attempt flushes its buffer before exiting, so the persisted size is final
    // once it has been joined.
    joinWorker(previous);

    std::lock_guard<std::mutex> lk(mutex_);
    if (invalidated_ || state_ != TransferState::Active || worker_.joinable())
        return; // suspended or cancelled again while we waited
    const auto offset = store_.size();
    spdlog::info("[TransferController] Resuming {} from offset {}", url_, offset);
    launchLocked(offset);
}

void TransferController::cancel() {
    abort(Error{ErrorCode::Cancelled, "transfer cancelled"});
}

void TransferController::abort(Error reason) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (invalidated_ || isTerminal(state_))
            return;
        state_ = TransferState::Failed;
        failure_ = reason;
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }

    // The running attempt is not joined here: it observes the stale generation and unwinds on its
    // own, its appends fail once the store is removed, and its epilogue sees the terminal state.
    if (auto r = store_.remove(); !r.ok()) {
        spdlog::warn("[TransferController] {}", r.error().message);
    }
    spdlog::error("[TransferController] Transfer failed ({}): {}", errorCodeName(reason.code),
                  reason.message);
    if (events_.onFailed)
        events_.onFailed(reason);
}

void TransferController::invalidate() {
    std::thread running;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (invalidated_)
            return;
        invalidated_ = true;
        generation_.fetch_add(1, std::memory_order_acq_rel);
        running = std::move(worker_);
    }
    joinWorker(running);
}

void TransferController::joinWorker(std::thread& worker) {
    if (!worker.joinable())
        return;
    if (worker.get_id() == std::this_thread::get_id()) {
        spdlog::warn("[TransferController] Torn down from its own worker; detaching");
        worker.detach();
        return;
    }
    worker.join();
}

TransferState TransferController::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

std::optional<Error> TransferController::failure() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return failure_;
}

std::uint64_t TransferController::bytesReceived() const noexcept {
    return bytesReceived_.load(std::memory_order_acquire);
}

std::optional<std::uint64_t> TransferController::expectedLength() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return expectedLength_;
}

std::optional<ContentInfo> TransferController::contentInfo() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return contentInfo_;
}

void TransferController::runAttempt(std::uint64_t generation, std::uint64_t offset) {
    Attempt attempt;
    attempt.generation = generation;
    attempt.offset = offset;

    FetchRequest request;
    std::optional<std::uint64_t> expected;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        request.url = url_;
        request.headers = headers_;
        expected = expectedLength_;
        if (bodyComplete_)
            expected = offset;
    }
    request.offset = offset;
    request.requestTimeout = config_.requestTimeout;
    request.resourceTimeout = config_.resourceTimeout;
    request.tls = config_.tls;
    request.proxy = config_.proxy;
    request.followRedirects = config_.followRedirects;
    if (offset > 0) {
        request.headers.push_back(Header{"Range", rangeHeaderValue(offset)});
    }

    Expected<void> result;
    if (offset > 0 && expected && offset >= *expected) {
        // A previous attempt already persisted the whole resource.
        spdlog::debug("[TransferController] Nothing left to fetch ({} of {} bytes)", offset,
                      *expected);
    } else {
        auto shouldCancel = [this, generation] {
            return generation_.load(std::memory_order_acquire) != generation;
        };
        result = transport_->fetch(
            request,
            [this, &attempt](const ResponseInfo& response) {
                return handleResponse(attempt, response);
            },
            [this, &attempt](ByteSpan chunk) { return handleChunk(attempt, chunk); },
            shouldCancel);
    }

    if (attempt.satisfied)
        result = Expected<void>{};

    const auto tailBytes = attempt.buffer.size();
    auto flushed = flush(attempt);
    if (!flushed.ok()) {
        if (result.ok() || result.error().code == ErrorCode::Cancelled ||
            result.error().code == ErrorCode::TransientConnectivityLoss) {
            result = flushed.error();
        }
    }

    std::unique_lock<std::mutex> lk(mutex_);
    if (invalidated_ || isTerminal(state_))
        return;

    const bool current = generation_.load(std::memory_order_acquire) == generation;
    if (!current) {
        // Suspended (or superseded) while running. A body that still arrived in full completes
        // the transfer; anything else waits for resume().
        if (result.ok() && state_ == TransferState::Active)
            bodyComplete_ = true;
        if (!result.ok() || state_ != TransferState::Suspended) {
            lk.unlock();
            // The tail of the interrupted attempt is on disk now; readers may use it.
            if (flushed.ok() && tailBytes > 0 && events_.onFlushed) {
                spdlog::debug("[TransferController] Interrupted attempt left {} bytes on disk",
                              tailBytes);
                events_.onFlushed();
            }
            return;
        }
    }

    if (result.ok()) {
        if (auto mismatch = verifyCompletedFile()) {
            result = *mismatch;
        } else if (auto synced = store_.sync(); !synced.ok()) {
            result = synced.error();
        } else {
            state_ = TransferState::Completed;
            generation_.fetch_add(1, std::memory_order_acq_rel);
            const auto size = store_.size();
            lk.unlock();
            spdlog::info("[TransferController] Completed {} ({} bytes)", request.url, size);
            if (events_.onCompleted)
                events_.onCompleted();
            return;
        }
    }

    auto error = result.error();
    if (error.code == ErrorCode::TransientConnectivityLoss) {
        state_ = TransferState::Suspended;
        generation_.fetch_add(1, std::memory_order_acq_rel);
        const auto persisted = store_.size();
        lk.unlock();
        spdlog::warn("[TransferController] Connectivity lost at {} bytes, suspending: {}",
                     persisted, error.message);
        if (events_.onSuspended)
            events_.onSuspended(error);
        return;
    }

    state_ = TransferState::Failed;
    failure_ = error;
    generation_.fetch_add(1, std::memory_order_acq_rel);
    lk.unlock();

    if (auto r = store_.remove(); !r.ok()) {
        spdlog::warn("[TransferController] {}", r.error().message);
    }
    spdlog::error("[TransferController] Transfer failed ({}): {}", errorCodeName(error.code),
                  error.message);
    if (events_.onFailed)
        events_.onFailed(error);
}

Expected<void> TransferController::handleResponse(Attempt& attempt,
                                                  const ResponseInfo& response) {
    if (response.httpStatus == 416 && attempt.offset > 0 && response.totalLength &&
        *response.totalLength == attempt.offset) {
        spdlog::info("[TransferController] Resource already complete at {} bytes", attempt.offset);
        attempt.satisfied = true;
        std::lock_guard<std::mutex> lk(mutex_);
        expectedLength_ = response.totalLength;
        if (!contentInfo_)
            contentInfo_ = ContentInfo{response.contentType, response.totalLength, true};
        return Expected<void>{};
    }
    // Only a 2xx body is the resource; redirects that were not followed, 304 and errors are not.
    if (response.httpStatus < 200 || response.httpStatus >= 300) {
        return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(response.httpStatus),
                     static_cast<int>(response.httpStatus)};
    }

    const bool partial = response.httpStatus == 206;
    if (attempt.offset > 0 && !partial) {
        spdlog::warn("[TransferController] Server ignored Range (status {}, {}); skipping {} bytes",
                     response.httpStatus,
                     response.acceptRangesBytes ? "advertises Accept-Ranges: bytes"
                                                : "no Accept-Ranges",
                     attempt.offset);
        attempt.skip = attempt.offset;
    } else if (attempt.offset == 0 && !response.acceptRangesBytes) {
        spdlog::debug("[TransferController] Server does not advertise byte ranges; a resume may "
                      "restart the body");
    }

    std::optional<std::uint64_t> total;
    if (response.totalLength) {
        total = response.totalLength;
    } else if (response.contentLength) {
        total = partial ? attempt.offset + *response.contentLength : *response.contentLength;
    }

    ContentInfo info;
    info.contentType = response.contentType;
    info.contentLength = total;
    // Ranges are always served locally from the backing file.
    info.byteRangeAccessSupported = true;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (total)
            expectedLength_ = total;
        else
            info.contentLength = expectedLength_;
        contentInfo_ = info;
    }

    spdlog::debug("[TransferController] Response {} type={} total={}", response.httpStatus,
                  info.contentType.value_or("?"),
                  info.contentLength ? std::to_string(*info.contentLength) : std::string("?"));
    if (events_.onResponse)
        events_.onResponse(info);
    return Expected<void>{};
}

Expected<void> TransferController::handleChunk(Attempt& attempt, ByteSpan chunk) {
    if (generation_.load(std::memory_order_acquire) != attempt.generation) {
        return Error{ErrorCode::Cancelled, "attempt superseded"};
    }
    if (attempt.satisfied)
        return Expected<void>{}; // error page body

    if (attempt.skip > 0) {
        const auto drop = static_cast<std::size_t>(std::min<std::uint64_t>(attempt.skip, chunk.size()));
        attempt.skip -= drop;
        chunk = chunk.subspan(drop);
        if (chunk.empty())
            return Expected<void>{};
    }

    attempt.buffer.insert(attempt.buffer.end(), chunk.begin(), chunk.end());
    bytesReceived_.fetch_add(chunk.size(), std::memory_order_acq_rel);

    if (attempt.buffer.size() >= config_.downloadBufferFlushThreshold) {
        if (auto r = flush(attempt); !r.ok())
            return r;
    }

    if (events_.onBytesReceived)
        events_.onBytesReceived(chunk);
    return Expected<void>{};
}

Expected<void> TransferController::flush(Attempt& attempt) {
    if (attempt.buffer.empty())
        return Expected<void>{};
    auto r = store_.append(ByteSpan(attempt.buffer.data(), attempt.buffer.size()));
    if (r.ok()) {
        spdlog::debug("[TransferController] Flushed {} bytes", attempt.buffer.size());
    }
    attempt.buffer.clear();
    return r;
}

std::optional<Error> TransferController::verifyCompletedFile() const {
    const auto size = store_.size();
    if (config_.verifyDownloadedFileSize && expectedLength_ && *expectedLength_ != size) {
        return Error{ErrorCode::SizeMismatch, "wrong file size, expected: " +
                                                  std::to_string(*expectedLength_) +
                                                  ", actual: " + std::to_string(size)};
    }
    if (config_.minimumExpectedFileSize > 0 && size < config_.minimumExpectedFileSize) {
        return Error{ErrorCode::SizeMismatch,
                     "file size " + std::to_string(size) + " is smaller than minimum expected " +
                         std::to_string(config_.minimumExpectedFileSize)};
    }
    return std::nullopt;
}

} // namespace streamcache::cache
