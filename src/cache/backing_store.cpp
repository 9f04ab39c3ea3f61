/*
 * streamcache/src/cache/backing_store.cpp
 *
 * BackingStore implementation:
 * - One descriptor opened O_RDWR|O_CREAT for the whole session
 * - Appends are positional writes at the current size; a failed append is rolled back with
 *   ftruncate so size never runs ahead of the file
 * - Reads are positional and never see past the last completed append
 */

#include <streamcache/cache/backing_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace streamcache::cache {

namespace fs = std::filesystem;

namespace {

Error makeIoError(std::string_view what, const fs::path& p, int err) {
    return Error{ErrorCode::FilesystemError,
                 std::string(what) + " failed for " + p.string() + ": " + std::strerror(err)};
}

} // namespace

Expected<std::unique_ptr<BackingStore>> BackingStore::open(const fs::path& path) {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "BackingStore.open: empty path"};
    }

    const bool existed = fs::exists(path);
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return makeIoError("open()", path, errno);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return makeIoError("fstat()", path, err);
    }

    const auto size = static_cast<std::uint64_t>(st.st_size);
    if (existed) {
        spdlog::info("[BackingStore] Reusing existing file {} ({} bytes)", path.string(), size);
    } else {
        spdlog::debug("[BackingStore] Created {}", path.string());
    }

    return std::unique_ptr<BackingStore>(new BackingStore(path, fd, size));
}

BackingStore::BackingStore(fs::path path, int fd, std::uint64_t size)
    : path_(std::move(path)), fd_(fd), size_(size) {}

BackingStore::~BackingStore() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::uint64_t BackingStore::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return size_;
}

bool BackingStore::removed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return removed_;
}

Expected<void> BackingStore::append(ByteSpan bytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (removed_ || fd_ < 0) {
        return Error{ErrorCode::FilesystemError, "append on removed store: " + path_.string()};
    }
    if (bytes.empty()) {
        return Expected<void>{};
    }

    const auto* data = reinterpret_cast<const char*>(bytes.data());
    std::size_t written = 0;
    while (written < bytes.size()) {
        const auto n = ::pwrite(fd_, data + written, bytes.size() - written,
                                static_cast<off_t>(size_ + written));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
                spdlog::warn("[BackingStore] Rollback of partial append failed for {}: {}",
                             path_.string(), std::strerror(errno));
            }
            return makeIoError("pwrite()", path_, err);
        }
        written += static_cast<std::size_t>(n);
    }

    size_ += written;
    return Expected<void>{};
}

Expected<std::vector<std::byte>> BackingStore::read(std::uint64_t offset,
                                                    std::uint64_t length) const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (removed_ || fd_ < 0) {
        return Error{ErrorCode::FilesystemError, "read on removed store: " + path_.string()};
    }
    if (offset >= size_) {
        return Error{ErrorCode::OutOfRange, "offset " + std::to_string(offset) +
                                                " is beyond persisted size " +
                                                std::to_string(size_)};
    }

    const auto count = static_cast<std::size_t>(std::min(length, size_ - offset));
    std::vector<std::byte> out(count);
    std::size_t got = 0;
    while (got < count) {
        const auto n = ::pread(fd_, reinterpret_cast<char*>(out.data()) + got, count - got,
                               static_cast<off_t>(offset + got));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return makeIoError("pread()", path_, errno);
        }
        if (n == 0) {
            return Error{ErrorCode::FilesystemError,
                         "unexpected end of file while reading " + path_.string()};
        }
        got += static_cast<std::size_t>(n);
    }
    return out;
}

Expected<void> BackingStore::sync() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (removed_ || fd_ < 0) {
        return Error{ErrorCode::FilesystemError, "sync on removed store: " + path_.string()};
    }
    if (::fsync(fd_) != 0) {
        return makeIoError("fsync()", path_, errno);
    }
    return Expected<void>{};
}

Expected<void> BackingStore::remove() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (removed_) {
        return Expected<void>{};
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    removed_ = true;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError,
                     "remove failed for " + path_.string() + ": " + ec.message()};
    }
    spdlog::debug("[BackingStore] Removed {}", path_.string());
    return Expected<void>{};
}

} // namespace streamcache::cache
