// TransferController against a scripted transport: resume headers, suspend/resume, servers that
// ignore Range, completion verification and terminal failures.

#include <catch2/catch_test_macros.hpp>

#include <streamcache/cache/backing_store.hpp>
#include <streamcache/cache/transfer_controller.hpp>

#include "../../support/temp_dir_scope.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <filesystem>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace streamcache::cache;
using namespace streamcache::test_support;

namespace {

constexpr const char* kUrl = "https://media.example.com/episode.mp3";

// Records every controller event
struct EventLog {
    std::mutex mutex;
    std::vector<ContentInfo> responses;
    std::uint64_t bytes{0};
    int suspended{0};
    int flushed{0};
    int completed{0};
    std::vector<Error> failures;

    TransferController::Events events() {
        TransferController::Events ev;
        ev.onResponse = [this](const ContentInfo& info) {
            std::lock_guard<std::mutex> lk(mutex);
            responses.push_back(info);
        };
        ev.onBytesReceived = [this](ByteSpan chunk) {
            std::lock_guard<std::mutex> lk(mutex);
            bytes += chunk.size();
        };
        ev.onSuspended = [this](const Error&) {
            std::lock_guard<std::mutex> lk(mutex);
            ++suspended;
        };
        ev.onFlushed = [this] {
            std::lock_guard<std::mutex> lk(mutex);
            ++flushed;
        };
        ev.onCompleted = [this] {
            std::lock_guard<std::mutex> lk(mutex);
            ++completed;
        };
        ev.onFailed = [this](const Error& e) {
            std::lock_guard<std::mutex> lk(mutex);
            failures.push_back(e);
        };
        return ev;
    }

    int completedCount() {
        std::lock_guard<std::mutex> lk(mutex);
        return completed;
    }
    int suspendedCount() {
        std::lock_guard<std::mutex> lk(mutex);
        return suspended;
    }
    int flushedCount() {
        std::lock_guard<std::mutex> lk(mutex);
        return flushed;
    }
    std::vector<Error> errors() {
        std::lock_guard<std::mutex> lk(mutex);
        return failures;
    }
    std::uint64_t byteCount() {
        std::lock_guard<std::mutex> lk(mutex);
        return bytes;
    }
};

struct Harness {
    TempDirScope dir = TempDirScope::unique_under("sc-transfer");
    fs::path path = dir.file("episode.mp3");
    std::unique_ptr<BackingStore> store;
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    EventLog log;
    CacheConfig config;
    std::unique_ptr<TransferController> controller;

    explicit Harness(std::size_t flushThreshold = 256) {
        config.downloadBufferFlushThreshold = flushThreshold;
    }

    void open(const std::vector<std::byte>& existing = {}) {
        if (!existing.empty())
            write_file(path, existing);
        auto s = BackingStore::open(path);
        REQUIRE(s.ok());
        store = std::move(s).value();
        controller = std::make_unique<TransferController>(*store, transport, config, log.events());
    }

    bool waitState(TransferState s) {
        return wait_for([&] { return controller->state() == s; });
    }

    // Completed state plus the completion event (which fires after the state flips)
    bool waitCompleted() {
        return waitState(TransferState::Completed) &&
               wait_for([&] { return log.completedCount() == 1; });
    }
};

} // namespace

TEST_CASE("TransferController: fresh download", "[cache][transfer]") {
    Harness h;
    h.open();
    const auto payload = make_payload(5000);
    h.transport->push(ScriptedAttempt::ok(200, payload, 700));

    REQUIRE(h.controller->start(kUrl, 0, {{"User-Agent", "streamcache-test"}}).ok());
    REQUIRE(h.waitCompleted());

    auto requests = h.transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].url == kUrl);
    CHECK(requests[0].offset == 0);
    CHECK_FALSE(ScriptedTransport::header(requests[0], "Range").has_value());
    CHECK(ScriptedTransport::header(requests[0], "User-Agent") == "streamcache-test");

    CHECK(read_file(h.path) == payload);
    CHECK(h.controller->bytesReceived() == 5000);
    CHECK(h.controller->expectedLength() == 5000u);
    CHECK(h.log.completedCount() == 1);
    CHECK(h.log.errors().empty());
    CHECK(h.log.byteCount() == 5000);

    auto info = h.controller->contentInfo();
    REQUIRE(info.has_value());
    CHECK(info->contentType == "application/octet-stream");
    CHECK(info->contentLength == 5000u);
    CHECK(info->byteRangeAccessSupported);
}

TEST_CASE("TransferController: start preconditions", "[cache][transfer]") {
    Harness h;
    const auto payload = make_payload(1000);
    h.open(slice(payload, 0, 100));

    SECTION("Resume offset must match the persisted size") {
        auto r = h.controller->start(kUrl, 0);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(h.controller->state() == TransferState::Idle);
        CHECK(h.transport->fetchCount() == 0);
    }

    SECTION("Empty url") {
        auto r = h.controller->start("", 100);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Only once") {
        h.transport->push(ScriptedAttempt::ok(206, slice(payload, 100, 900), 300, 1000));
        REQUIRE(h.controller->start(kUrl, 100).ok());
        auto again = h.controller->start(kUrl, 100);
        REQUIRE_FALSE(again.ok());
        CHECK(again.error().code == ErrorCode::InvalidArgument);
        REQUIRE(h.waitCompleted());
    }
}

TEST_CASE("TransferController: resume from a partial file", "[cache][transfer]") {
    Harness h;
    const auto payload = make_payload(3000);
    h.open(slice(payload, 0, 1200));

    SECTION("Range request answered with 206") {
        auto a = ScriptedAttempt::ok(206, slice(payload, 1200, 1800), 500, 3000);
        h.transport->push(a);

        REQUIRE(h.controller->start(kUrl, 1200).ok());
        REQUIRE(h.waitCompleted());

        auto requests = h.transport->requests();
        REQUIRE(requests.size() == 1);
        CHECK(ScriptedTransport::header(requests[0], "Range") == "bytes=1200-");
        CHECK(requests[0].offset == 1200);
        CHECK(read_file(h.path) == payload);
        CHECK(h.controller->expectedLength() == 3000u);
    }

    SECTION("206 without Content-Range derives the total from the offset") {
        auto a = ScriptedAttempt::ok(206, slice(payload, 1200, 1800), 500);
        h.transport->push(a);

        REQUIRE(h.controller->start(kUrl, 1200).ok());
        REQUIRE(h.waitCompleted());
        CHECK(h.controller->expectedLength() == 3000u);
        CHECK(read_file(h.path) == payload);
    }

    SECTION("Server ignores Range and sends the whole resource") {
        h.transport->push(ScriptedAttempt::ok(200, payload, 512));

        REQUIRE(h.controller->start(kUrl, 1200).ok());
        REQUIRE(h.waitCompleted());

        CHECK(read_file(h.path) == payload);
        CHECK(h.log.byteCount() == 1800);
        CHECK(h.controller->bytesReceived() == 3000);
    }

    SECTION("416 for a file that is already complete") {
        h.controller.reset();
        h.store.reset();
        write_file(h.path, payload); // a finished download already on disk
        h.open();
        auto a = ScriptedAttempt::status(416);
        a.response.totalLength = 3000;
        a.chunks = {std::vector<std::byte>(64, std::byte{'x'})}; // error page body
        h.transport->push(a);

        REQUIRE(h.controller->start(kUrl, 3000).ok());
        REQUIRE(h.waitCompleted());
        CHECK(read_file(h.path) == payload);
        CHECK(h.log.errors().empty());
    }
}

TEST_CASE("TransferController: suspend and resume", "[cache][transfer]") {
    Harness h(4096); // larger than what arrives before the suspend: flushed at attempt end
    h.open();
    const auto payload = make_payload(6000);

    auto first = ScriptedAttempt::ok(200, slice(payload, 0, 1500), 500, std::nullopt);
    first.response.contentLength = 6000;
    first.holdUntilCancelled = true;
    h.transport->push(first);
    h.transport->push(ScriptedAttempt::ok(206, slice(payload, 1500, 4500), 1000, 6000));

    REQUIRE(h.controller->start(kUrl, 0).ok());
    REQUIRE(wait_for([&] { return h.controller->bytesReceived() == 1500; }));

    h.controller->suspend();
    CHECK(h.controller->state() == TransferState::Suspended);
    REQUIRE(wait_for([&] { return h.transport->finishedFetches() == 1; }));

    SECTION("Suspend is idempotent and keeps progress") {
        h.controller->suspend();
        CHECK(h.controller->state() == TransferState::Suspended);
        REQUIRE(wait_for([&] { return h.store->size() == 1500; }));
        CHECK(fs::exists(h.path));
        CHECK(h.log.suspendedCount() == 0); // explicit suspend is not a transient-loss event
        CHECK(h.transport->fetchCount() == 1);
    }

    SECTION("The flushed tail is announced once") {
        REQUIRE(wait_for([&] { return h.log.flushedCount() == 1; }));
        CHECK(h.store->size() == 1500);
        h.controller->suspend();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK(h.log.flushedCount() == 1);
    }

    SECTION("Resume continues from the persisted size") {
        h.controller->resume();
        REQUIRE(h.waitCompleted());

        auto requests = h.transport->requests();
        REQUIRE(requests.size() == 2);
        CHECK(ScriptedTransport::header(requests[1], "Range") == "bytes=1500-");
        CHECK(read_file(h.path) == payload);
        CHECK(h.log.completedCount() == 1);

        // Resume after completion is a no-op
        h.controller->resume();
        CHECK(h.transport->fetchCount() == 2);
    }
}

TEST_CASE("TransferController: transient loss suspends", "[cache][transfer]") {
    Harness h;
    h.open();
    const auto payload = make_payload(4000);

    auto dropped = ScriptedAttempt::ok(200, slice(payload, 0, 2000), 500);
    dropped.response.contentLength = 4000;
    dropped.outcome = Error{ErrorCode::TransientConnectivityLoss, "connection reset"};
    h.transport->push(dropped);

    REQUIRE(h.controller->start(kUrl, 0).ok());
    REQUIRE(h.waitState(TransferState::Suspended));
    REQUIRE(wait_for([&] { return h.log.suspendedCount() == 1; }));

    CHECK(h.store->size() == 2000);
    CHECK(fs::exists(h.path));
    CHECK(h.log.errors().empty());

    SECTION("Externally resumed") {
        h.transport->push(ScriptedAttempt::ok(206, slice(payload, 2000, 2000), 500, 4000));
        h.controller->resume();
        REQUIRE(h.waitCompleted());
        CHECK(ScriptedTransport::header(h.transport->requests()[1], "Range") == "bytes=2000-");
        CHECK(read_file(h.path) == payload);
    }

    SECTION("Cancelled while suspended is terminal") {
        h.controller->cancel();
        CHECK(h.controller->state() == TransferState::Failed);
        CHECK_FALSE(fs::exists(h.path));
        auto errs = h.log.errors();
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].code == ErrorCode::Cancelled);
    }
}

TEST_CASE("TransferController: terminal failures delete the file", "[cache][transfer]") {
    Harness h;
    h.open();
    const auto payload = make_payload(2000);

    SECTION("HTTP 404") {
        h.transport->push(ScriptedAttempt::status(404));
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitState(TransferState::Failed));
        REQUIRE(wait_for([&] { return h.log.errors().size() == 1; }));

        auto err = h.log.errors()[0];
        CHECK(err.code == ErrorCode::ServerError);
        CHECK(err.httpStatus == 404);
        CHECK_FALSE(fs::exists(h.path));
        CHECK(h.controller->failure().has_value());
    }

    SECTION("Redirect body is never cached") {
        auto a = ScriptedAttempt::status(302);
        a.chunks = chunked(payload, 500);
        a.response.contentLength = payload.size();
        h.transport->push(a);
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitState(TransferState::Failed));
        REQUIRE(wait_for([&] { return h.log.errors().size() == 1; }));

        auto err = h.log.errors()[0];
        CHECK(err.code == ErrorCode::ServerError);
        CHECK(err.httpStatus == 302);
        CHECK(h.log.byteCount() == 0);
        CHECK(h.log.completedCount() == 0);
        CHECK_FALSE(fs::exists(h.path));
    }

    SECTION("304 Not Modified is not the resource") {
        h.transport->push(ScriptedAttempt::status(304));
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitState(TransferState::Failed));
        REQUIRE(wait_for([&] { return h.log.errors().size() == 1; }));
        CHECK(h.log.errors()[0].httpStatus == 304);
        CHECK_FALSE(fs::exists(h.path));
    }

    SECTION("Body shorter than the declared length") {
        auto a = ScriptedAttempt::ok(200, slice(payload, 0, 1500), 500);
        a.response.contentLength = 2000;
        h.transport->push(a);
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitState(TransferState::Failed));
        REQUIRE(wait_for([&] { return h.log.errors().size() == 1; }));

        CHECK(h.log.errors()[0].code == ErrorCode::SizeMismatch);
        CHECK_FALSE(fs::exists(h.path));
        CHECK(h.log.completedCount() == 0);
    }

    SECTION("Below the minimum expected size") {
        h.config.minimumExpectedFileSize = 4096;
        h.controller = std::make_unique<TransferController>(*h.store, h.transport, h.config,
                                                            h.log.events());
        auto a = ScriptedAttempt::ok(200, payload, 500);
        a.response.contentLength.reset();
        h.transport->push(a);
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitState(TransferState::Failed));
        REQUIRE(wait_for([&] { return h.log.errors().size() == 1; }));
        CHECK(h.log.errors()[0].code == ErrorCode::SizeMismatch);
        CHECK_FALSE(fs::exists(h.path));
    }

    SECTION("Length mismatch tolerated when verification is off") {
        h.config.verifyDownloadedFileSize = false;
        h.controller = std::make_unique<TransferController>(*h.store, h.transport, h.config,
                                                            h.log.events());
        auto a = ScriptedAttempt::ok(200, slice(payload, 0, 1500), 500);
        a.response.contentLength = 2000;
        h.transport->push(a);
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitCompleted());
        CHECK(fs::exists(h.path));
        CHECK(h.store->size() == 1500);
    }

    SECTION("Timeout is terminal") {
        auto a = ScriptedAttempt::ok(200, slice(payload, 0, 500), 500);
        a.outcome = Error{ErrorCode::Timeout, "operation timed out"};
        h.transport->push(a);
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(h.waitState(TransferState::Failed));
        REQUIRE(wait_for([&] { return h.log.errors().size() == 1; }));
        CHECK(h.log.errors()[0].code == ErrorCode::Timeout);
        CHECK_FALSE(fs::exists(h.path));
    }

    SECTION("Explicit cancel while active") {
        auto a = ScriptedAttempt::ok(200, slice(payload, 0, 500), 500);
        a.holdUntilCancelled = true;
        h.transport->push(a);
        REQUIRE(h.controller->start(kUrl, 0).ok());
        REQUIRE(wait_for([&] { return h.controller->bytesReceived() == 500; }));

        h.controller->cancel();
        h.controller->cancel(); // fires once
        CHECK(h.controller->state() == TransferState::Failed);
        CHECK_FALSE(fs::exists(h.path));
        auto errs = h.log.errors();
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].code == ErrorCode::Cancelled);

        // The interrupted attempt unwinds without further events
        REQUIRE(wait_for([&] { return h.transport->finishedFetches() == 1; }));
        CHECK(h.log.errors().size() == 1);
        CHECK(h.log.completedCount() == 0);
    }
}

TEST_CASE("TransferController: invalidate keeps partial bytes and is silent", "[cache][transfer]") {
    Harness h;
    h.open();
    const auto payload = make_payload(3000);
    auto a = ScriptedAttempt::ok(200, slice(payload, 0, 1000), 250);
    a.response.contentLength = 3000;
    a.holdUntilCancelled = true;
    h.transport->push(a);

    REQUIRE(h.controller->start(kUrl, 0).ok());
    REQUIRE(wait_for([&] { return h.controller->bytesReceived() == 1000; }));

    h.controller->invalidate();
    CHECK(h.transport->finishedFetches() == 1);
    CHECK(fs::exists(h.path));
    CHECK(read_file(h.path) == slice(payload, 0, 1000));
    CHECK(h.log.errors().empty());
    CHECK(h.log.completedCount() == 0);
    CHECK(h.log.suspendedCount() == 0);

    // Nothing moves once invalidated
    h.controller->resume();
    h.controller->cancel();
    CHECK(h.log.errors().empty());
    CHECK(fs::exists(h.path));
}
