#pragma once

/*
 * StreamCache - Public Types and Collaborator Interfaces (C++20)
 *
 * This header defines the data types shared by the progressive download cache and the abstract
 * interfaces of its external collaborators (HTTP transport, reachability probe). It contains no
 * implementation details.
 *
 * Design principles:
 * - One cache session serves exactly one URL / backing file pair
 * - The backing file is the in-order concatenation of received bytes, nothing else
 * - Transient connectivity loss pauses a transfer, every other failure is terminal
 * - Events are explicit callbacks registered by the owner, never broadcast
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamcache::cache {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for cache operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    TransientConnectivityLoss, // network unreachable / connection dropped; pauses the transfer
    ServerError,               // non-2xx HTTP status
    SizeMismatch,              // expected or minimum length check failed after stream end
    OutOfRange,                // read offset at or beyond the persisted size
    FilesystemError,           // any I/O failure on the backing store
    Timeout,
    TlsVerificationFailed,
    Cancelled,
    Unknown
};

[[nodiscard]] constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::TransientConnectivityLoss:
            return "TransientConnectivityLoss";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::SizeMismatch:
            return "SizeMismatch";
        case ErrorCode::OutOfRange:
            return "OutOfRange";
        case ErrorCode::FilesystemError:
            return "FilesystemError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * Lifecycle of the single network transfer owned by a cache session.
 * Completed and Failed are terminal.
 */
enum class TransferState { Idle, Active, Suspended, Completed, Failed };

[[nodiscard]] constexpr const char* transferStateName(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle:
            return "idle";
        case TransferState::Active:
            return "active";
        case TransferState::Suspended:
            return "suspended";
        case TransferState::Completed:
            return "completed";
        case TransferState::Failed:
            return "failed";
    }
    return "unknown";
}

// Requested length meaning "every byte from offset to the end of the resource".
inline constexpr std::uint64_t kToEndOfResource = std::numeric_limits<std::uint64_t>::max();

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Tunables of one cache session.
 */
struct CacheConfig {
    // Bytes accumulated in memory before they are appended to the backing file.
    std::size_t downloadBufferFlushThreshold{128u * 1024u};
    // Upper bound of a single read copied into memory while fulfilling a request.
    std::size_t maxInMemoryReadChunk{10u * 1024u * 1024u};
    bool verifyDownloadedFileSize{true};
    std::uint64_t minimumExpectedFileSize{0}; // 0 = disabled
    std::chrono::milliseconds requestTimeout{60000};
    std::chrono::milliseconds resourceTimeout{60ll * 60ll * 1000ll};
    std::chrono::milliseconds connectivityPollInterval{1000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
};

/**
 * What the server told us about the resource.
 */
struct ContentInfo {
    std::optional<std::string> contentType;
    std::optional<std::uint64_t> contentLength; // total resource length, when known
    bool byteRangeAccessSupported{true};
};

/**
 * Download progress snapshot.
 */
struct ProgressEvent {
    std::uint64_t bytesDownloaded{0};
    std::optional<std::uint64_t> bytesExpected{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ByteSpan = std::span<const std::byte>;
using ShouldCancel = std::function<bool()>; // return true to abort the attempt ASAP

// ==========================
// Collaborator interfaces
// ==========================

/**
 * Response metadata of one transfer attempt, reported before the first body byte.
 */
struct ResponseInfo {
    long httpStatus{0};
    std::optional<std::uint64_t> contentLength{}; // body length of this response
    std::optional<std::uint64_t> totalLength{};   // from "Content-Range: bytes a-b/total"
    std::optional<std::string> contentType{};
    bool acceptRangesBytes{false};
};

/**
 * One GET attempt. `headers` already carries the Range header when resuming; `offset` is the
 * first byte the caller expects to receive.
 */
struct FetchRequest {
    std::string url;
    std::vector<Header> headers;
    std::uint64_t offset{0};
    std::chrono::milliseconds requestTimeout{60000};
    std::chrono::milliseconds resourceTimeout{60ll * 60ll * 1000ll};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * HTTP transport abstraction (libcurl-based implementation satisfies this).
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * Run one GET to completion, delivering the response metadata once and then the body in
     * arrival order. The callbacks are invoked on the calling thread. Returning an error from a
     * callback, or `shouldCancel()` turning true, aborts the attempt.
     */
    virtual Expected<void> fetch(const FetchRequest& request,
                                 const std::function<Expected<void>(const ResponseInfo&)>& onResponse,
                                 const std::function<Expected<void>(ByteSpan)>& sink,
                                 const ShouldCancel& shouldCancel) = 0;
};

/**
 * Point-in-time network reachability check, polled by ConnectivityMonitor.
 */
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;
    virtual bool isReachable() = 0;
};

// ======================
// Utility helpers
// ======================

/**
 * Value of the Range header used to resume from `offset`.
 */
[[nodiscard]] inline std::string rangeHeaderValue(std::uint64_t offset) {
    return "bytes=" + std::to_string(offset) + "-";
}

/**
 * Factory for the libcurl transport.
 */
std::shared_ptr<IHttpTransport> makeCurlHttpTransport();

/**
 * Factory for the interface-based reachability probe (a non-loopback interface that is up,
 * running and carries an IPv4/IPv6 address counts as reachable).
 */
std::shared_ptr<IReachabilityProbe> makeInterfaceReachabilityProbe();

} // namespace streamcache::cache
