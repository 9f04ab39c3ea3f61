/*
 * streamcache/src/cache/cache_engine.cpp
 *
 * CacheEngine:
 * - Background io_context (one thread, kept alive by a work guard) hosts the ConnectivityMonitor
 *   poll loop; connectivity transitions are handled on that thread
 * - Transfer events arrive on the transfer worker thread; read requests on any caller thread
 * - Engine events pass through a single terminal latch so completion/failure fire once and
 *   nothing fires afterwards
 */

#include <streamcache/cache/backing_store.hpp>
#include <streamcache/cache/cache_engine.hpp>
#include <streamcache/cache/connectivity_monitor.hpp>
#include <streamcache/cache/transfer_controller.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

namespace streamcache::cache {

namespace fs = std::filesystem;

struct CacheEngine::Runtime {
    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard{
        boost::asio::make_work_guard(io)};
    std::thread thread;
    std::unique_ptr<ConnectivityMonitor> monitor;
};

Expected<std::unique_ptr<CacheEngine>>
CacheEngine::open(Options options, Events events, std::shared_ptr<IHttpTransport> transport,
                  std::shared_ptr<IReachabilityProbe> probe) {
    if (options.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "CacheEngine.open: empty url"};
    }
    if (options.filePath.empty()) {
        return Error{ErrorCode::InvalidArgument, "CacheEngine.open: empty file path"};
    }

    if (options.filePath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(options.filePath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::FilesystemError,
                         "create_directories failed for " +
                             options.filePath.parent_path().string() + ": " + ec.message()};
        }
    }

    auto store = BackingStore::open(options.filePath);
    if (!store.ok()) {
        return store.error();
    }

    if (!transport)
        transport = makeCurlHttpTransport();
    if (!probe)
        probe = makeInterfaceReachabilityProbe();

    std::unique_ptr<CacheEngine> engine(new CacheEngine(std::move(options), std::move(events),
                                                        std::move(store).value(),
                                                        std::move(transport), std::move(probe)));
    return Expected<std::unique_ptr<CacheEngine>>(std::move(engine));
}

CacheEngine::CacheEngine(Options options, Events events, std::unique_ptr<BackingStore> store,
                         std::shared_ptr<IHttpTransport> transport,
                         std::shared_ptr<IReachabilityProbe> probe)
    : options_(std::move(options)), events_(std::move(events)), store_(std::move(store)) {
    fulfiller_ =
        std::make_unique<RequestFulfiller>(*store_, options_.config.maxInMemoryReadChunk);

    TransferController::Events transferEvents;
    transferEvents.onBytesReceived = [this](ByteSpan) { handleBytesReceived(); };
    transferEvents.onSuspended = [this](const Error&) { handleSuspended(); };
    transferEvents.onFlushed = [this] { runFulfillment(); };
    transferEvents.onCompleted = [this] { handleCompleted(); };
    transferEvents.onFailed = [this](const Error& error) { handleFailed(error); };
    transfer_ = std::make_unique<TransferController>(*store_, std::move(transport),
                                                     options_.config, std::move(transferEvents));

    runtime_ = std::make_unique<Runtime>();
    runtime_->monitor = std::make_unique<ConnectivityMonitor>(
        runtime_->io.get_executor(), std::move(probe), options_.config.connectivityPollInterval,
        [this](bool connected) { handleConnectivity(connected); });
    runtime_->thread = std::thread([rt = runtime_.get()] { rt->io.run(); });
    runtime_->monitor->start();

    spdlog::info("[CacheEngine] Opened {} -> {} ({} bytes persisted)", options_.url,
                 store_->path().string(), store_->size());
}

CacheEngine::~CacheEngine() {
    silenced_.store(true, std::memory_order_release);

    runtime_->monitor->stop();
    transfer_->invalidate();

    runtime_->workGuard.reset();
    runtime_->io.stop();
    if (runtime_->thread.joinable()) {
        if (runtime_->thread.get_id() == std::this_thread::get_id()) {
            runtime_->thread.detach();
        } else {
            runtime_->thread.join();
        }
    }

    fulfiller_->rejectAll(Error{ErrorCode::Cancelled, "cache engine closed"});
    spdlog::debug("[CacheEngine] Closed {}", store_->path().string());
}

ReadHandle CacheEngine::submitReadRequest(std::uint64_t offset, std::uint64_t length,
                                          ReadDelegate delegate) {
    const auto handle = fulfiller_->add(offset, length, std::move(delegate));

    // The request is already in the pending set, so a terminal transition racing with this call
    // either sees it (and drains/rejects it) or has happened before the state check below.
    switch (transfer_->state()) {
        case TransferState::Failed:
            fulfiller_->rejectAll(
                transfer_->failure().value_or(Error{ErrorCode::Cancelled, "transfer failed"}));
            return handle;
        case TransferState::Completed:
            if (auto r = fulfiller_->drain(); !r.ok()) {
                spdlog::warn("[CacheEngine] Serving read after completion failed: {}",
                             r.error().message);
            }
            return handle;
        default:
            break;
    }

    startTransferOnce();
    runFulfillment();
    return handle;
}

bool CacheEngine::cancelReadRequest(ReadHandle handle) {
    return fulfiller_->cancel(handle);
}

ProgressEvent CacheEngine::currentProgress() const {
    ProgressEvent progress;
    progress.bytesDownloaded = std::max(transfer_->bytesReceived(), store_->size());
    progress.bytesExpected = transfer_->expectedLength();
    return progress;
}

void CacheEngine::cancel() {
    spdlog::info("[CacheEngine] Cancelling {}", options_.url);
    transfer_->cancel();
}

Expected<void> CacheEngine::discardPartialFile() {
    if (transfer_->state() == TransferState::Completed) {
        spdlog::debug("[CacheEngine] Download complete, keeping {}", store_->path().string());
        return Expected<void>{};
    }
    // Stops an unfinished transfer first; a no-op when it already failed.
    transfer_->cancel();
    return store_->remove();
}

std::optional<ContentInfo> CacheEngine::contentInfo() const {
    return transfer_->contentInfo();
}

TransferState CacheEngine::state() const {
    return transfer_->state();
}

std::optional<bool> CacheEngine::isConnected() const {
    return runtime_->monitor->isConnected();
}

const fs::path& CacheEngine::filePath() const {
    return store_->path();
}

void CacheEngine::startTransferOnce() {
    if (started_.exchange(true, std::memory_order_acq_rel))
        return;
    const auto offset = store_->size();
    if (auto r = transfer_->start(options_.url, offset, options_.headers); !r.ok()) {
        transfer_->abort(r.error());
    }
}

void CacheEngine::runFulfillment() {
    if (auto r = fulfiller_->fulfill(); !r.ok()) {
        spdlog::error("[CacheEngine] Fulfillment failed: {}", r.error().message);
        transfer_->abort(r.error());
    }
}

bool CacheEngine::enterTerminal() {
    if (silenced_.load(std::memory_order_acquire))
        return false;
    return !terminal_.exchange(true, std::memory_order_acq_rel);
}

void CacheEngine::handleBytesReceived() {
    if (events_.onProgress && !silenced_.load(std::memory_order_acquire) &&
        !terminal_.load(std::memory_order_acquire)) {
        events_.onProgress(currentProgress());
    }
    runFulfillment();
}

void CacheEngine::handleSuspended() {
    // The final flush of the interrupted attempt may have made more bytes available.
    runFulfillment();
    runtime_->monitor->noteConnectionLost();
}

void CacheEngine::handleCompleted() {
    if (auto r = fulfiller_->drain(); !r.ok()) {
        spdlog::warn("[CacheEngine] Serving pending reads after completion failed: {}",
                     r.error().message);
    }
    if (enterTerminal() && events_.onCompleted) {
        events_.onCompleted(store_->path());
    }
}

void CacheEngine::handleFailed(const Error& error) {
    fulfiller_->rejectAll(error);
    if (enterTerminal() && events_.onFailed) {
        events_.onFailed(error);
    }
}

void CacheEngine::handleConnectivity(bool connected) {
    if (events_.onConnectivityChanged && !silenced_.load(std::memory_order_acquire) &&
        !terminal_.load(std::memory_order_acquire)) {
        events_.onConnectivityChanged(connected);
    }

    if (connected) {
        if (transfer_->state() == TransferState::Suspended) {
            spdlog::info("[CacheEngine] Connectivity restored, resuming");
            transfer_->resume();
        }
    } else if (transfer_->state() == TransferState::Active) {
        spdlog::info("[CacheEngine] Connectivity lost, suspending");
        transfer_->suspend();
    }
}

} // namespace streamcache::cache
