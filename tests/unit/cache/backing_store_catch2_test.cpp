// BackingStore: append/read semantics, resume from an existing file, removal, and readers racing
// a writer.

#include <catch2/catch_test_macros.hpp>

#include <streamcache/cache/backing_store.hpp>

#include "../../support/temp_dir_scope.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace streamcache::cache;
using streamcache::test_support::make_payload;
using streamcache::test_support::read_file;
using streamcache::test_support::slice;
using streamcache::test_support::TempDirScope;
using streamcache::test_support::write_file;

namespace {

std::unique_ptr<BackingStore> open_store(const fs::path& p) {
    auto store = BackingStore::open(p);
    REQUIRE(store.ok());
    return std::move(store).value();
}

ByteSpan span_of(const std::vector<std::byte>& v) {
    return ByteSpan(v.data(), v.size());
}

} // namespace

TEST_CASE("BackingStore: append and read", "[cache][backing_store]") {
    auto dir = TempDirScope::unique_under("sc-store");
    auto path = dir.file("media.bin");
    auto store = open_store(path);
    const auto payload = make_payload(4096);

    SECTION("New file starts empty") {
        CHECK(fs::exists(path));
        CHECK(store->size() == 0);
        CHECK(store->path() == path);
    }

    SECTION("Appends advance size and land in order") {
        REQUIRE(store->append(span_of(slice(payload, 0, 1000))).ok());
        CHECK(store->size() == 1000);
        REQUIRE(store->append(span_of(slice(payload, 1000, 3096))).ok());
        CHECK(store->size() == 4096);
        CHECK(read_file(path) == payload);
    }

    SECTION("Empty append is a no-op") {
        REQUIRE(store->append(ByteSpan{}).ok());
        CHECK(store->size() == 0);
    }

    SECTION("Read returns the requested slice") {
        REQUIRE(store->append(span_of(payload)).ok());
        auto r = store->read(100, 200);
        REQUIRE(r.ok());
        CHECK(r.value() == slice(payload, 100, 200));
    }

    SECTION("Read past the persisted tail is short") {
        REQUIRE(store->append(span_of(slice(payload, 0, 500))).ok());
        auto r = store->read(400, 1000);
        REQUIRE(r.ok());
        CHECK(r.value().size() == 100);
        CHECK(r.value() == slice(payload, 400, 100));
    }

    SECTION("Read at or beyond size is OutOfRange") {
        auto empty = store->read(0, 10);
        REQUIRE_FALSE(empty.ok());
        CHECK(empty.error().code == ErrorCode::OutOfRange);

        REQUIRE(store->append(span_of(slice(payload, 0, 10))).ok());
        auto atEnd = store->read(10, 1);
        REQUIRE_FALSE(atEnd.ok());
        CHECK(atEnd.error().code == ErrorCode::OutOfRange);
    }
}

TEST_CASE("BackingStore: existing file becomes the initial size", "[cache][backing_store]") {
    auto dir = TempDirScope::unique_under("sc-store");
    auto path = dir.file("partial.bin");
    const auto payload = make_payload(3000);
    write_file(path, slice(payload, 0, 1200));

    auto store = open_store(path);
    CHECK(store->size() == 1200);

    REQUIRE(store->append(span_of(slice(payload, 1200, 1800))).ok());
    CHECK(store->size() == 3000);
    CHECK(read_file(path) == payload);
}

TEST_CASE("BackingStore: remove", "[cache][backing_store]") {
    auto dir = TempDirScope::unique_under("sc-store");
    auto path = dir.file("gone.bin");
    auto store = open_store(path);
    const auto payload = make_payload(64);
    REQUIRE(store->append(span_of(payload)).ok());

    REQUIRE(store->remove().ok());
    CHECK_FALSE(fs::exists(path));
    CHECK(store->removed());

    SECTION("Idempotent") {
        CHECK(store->remove().ok());
    }

    SECTION("Append and read fail afterwards") {
        auto a = store->append(span_of(payload));
        REQUIRE_FALSE(a.ok());
        CHECK(a.error().code == ErrorCode::FilesystemError);

        auto r = store->read(0, 1);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::FilesystemError);
        CHECK_FALSE(fs::exists(path));
    }
}

TEST_CASE("BackingStore: open failures", "[cache][backing_store]") {
    SECTION("Empty path") {
        auto r = BackingStore::open(fs::path{});
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Missing parent directory") {
        auto dir = TempDirScope::unique_under("sc-store");
        auto r = BackingStore::open(dir.path() / "no" / "such" / "dir" / "file.bin");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::FilesystemError);
    }
}

TEST_CASE("BackingStore: readers never observe unwritten bytes", "[cache][backing_store][concurrency]") {
    auto dir = TempDirScope::unique_under("sc-store");
    auto store = open_store(dir.file("race.bin"));
    const auto payload = make_payload(256 * 1024);
    constexpr std::size_t kChunk = 1024;

    std::atomic<bool> writerDone{false};
    std::atomic<int> mismatches{0};
    std::atomic<int> sizeRegressions{0};

    std::thread writer([&] {
        for (std::size_t off = 0; off < payload.size(); off += kChunk) {
            auto r = store->append(span_of(slice(payload, off, kChunk)));
            if (!r.ok())
                break;
        }
        writerDone = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&, t] {
            std::uint64_t lastSize = 0;
            std::uint64_t offset = static_cast<std::uint64_t>(t) * 977;
            while (!writerDone.load()) {
                const auto size = store->size();
                if (size < lastSize)
                    ++sizeRegressions;
                lastSize = size;
                if (size == 0)
                    continue;
                offset = (offset + 4099) % size;
                auto r = store->read(offset, 4096);
                if (!r.ok()) {
                    ++mismatches;
                    continue;
                }
                if (r.value() != slice(payload, offset, r.value().size()))
                    ++mismatches;
            }
        });
    }

    writer.join();
    for (auto& r : readers)
        r.join();

    CHECK(mismatches.load() == 0);
    CHECK(sizeRegressions.load() == 0);
    CHECK(store->size() == payload.size());
}
