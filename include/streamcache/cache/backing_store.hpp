#pragma once

#include <streamcache/cache/cache.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace streamcache::cache {

/**
 * Append-and-random-read file backing one cache session.
 *
 * A single mutex serializes append/read/size so a reader never observes a size larger than what
 * has actually been written. The size only grows for the lifetime of the store; `remove()` ends
 * the store, after which every append fails.
 */
class BackingStore {
public:
    /**
     * Open (creating if absent) the backing file at `path`. An existing file is kept as-is and
     * its length becomes the initial size, which lets a session resume a partial download.
     */
    static Expected<std::unique_ptr<BackingStore>> open(const std::filesystem::path& path);

    ~BackingStore();

    BackingStore(const BackingStore&) = delete;
    BackingStore& operator=(const BackingStore&) = delete;

    [[nodiscard]] std::uint64_t size() const;

    Expected<void> append(ByteSpan bytes);

    /**
     * Up to `length` bytes starting at `offset`. OutOfRange when `offset >= size()`; short when
     * the range runs past the end.
     */
    Expected<std::vector<std::byte>> read(std::uint64_t offset, std::uint64_t length) const;

    // fsync the file
    Expected<void> sync();

    /**
     * Delete the backing file. Idempotent.
     */
    Expected<void> remove();

    [[nodiscard]] bool removed() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    BackingStore(std::filesystem::path path, int fd, std::uint64_t size);

    const std::filesystem::path path_;
    int fd_{-1};
    std::uint64_t size_{0};
    bool removed_{false};
    mutable std::mutex mutex_;
};

} // namespace streamcache::cache
