#include <streamcache/config/cache_config.h>
#include <streamcache/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>

namespace streamcache::config {

namespace {

constexpr const char* kSection = "cache";

void warnMalformed(const std::string& key, const std::string& raw) {
    spdlog::warn("[Config] Ignoring malformed value for cache.{}: '{}'", key, raw);
}

template <typename Parse, typename Assign>
void readKey(const std::filesystem::path& path, const std::string& key, Parse parse,
             Assign assign) {
    const auto raw = parse_config_value(path, kSection, key);
    if (raw.empty())
        return;
    if (auto v = parse(raw)) {
        assign(*v);
    } else {
        warnMalformed(key, raw);
    }
}

} // namespace

cache::Expected<cache::CacheConfig> loadCacheConfig(const std::filesystem::path& path) {
    {
        std::ifstream probe(path);
        if (!probe) {
            return cache::Error{cache::ErrorCode::FilesystemError,
                                "cannot open config file " + path.string()};
        }
    }

    cache::CacheConfig cfg;
    const auto u64 = [](const std::string& s) { return parse_u64(s); };
    const auto ms = [](const std::string& s) { return parse_ms(s); };
    const auto boolean = [](const std::string& s) { return parse_bool(s); };

    readKey(path, "download_buffer_flush_threshold", u64,
            [&](std::uint64_t v) { cfg.downloadBufferFlushThreshold = static_cast<std::size_t>(v); });
    readKey(path, "max_in_memory_read_chunk", u64,
            [&](std::uint64_t v) { cfg.maxInMemoryReadChunk = static_cast<std::size_t>(v); });
    readKey(path, "verify_downloaded_file_size", boolean,
            [&](bool v) { cfg.verifyDownloadedFileSize = v; });
    readKey(path, "minimum_expected_file_size", u64,
            [&](std::uint64_t v) { cfg.minimumExpectedFileSize = v; });
    readKey(path, "request_timeout_ms", ms,
            [&](std::chrono::milliseconds v) { cfg.requestTimeout = v; });
    readKey(path, "resource_timeout_ms", ms,
            [&](std::chrono::milliseconds v) { cfg.resourceTimeout = v; });
    readKey(path, "connectivity_poll_interval_ms", ms,
            [&](std::chrono::milliseconds v) { cfg.connectivityPollInterval = v; });
    readKey(path, "tls_insecure", boolean, [&](bool v) { cfg.tls.insecure = v; });
    readKey(path, "follow_redirects", boolean, [&](bool v) { cfg.followRedirects = v; });

    if (auto ca = parse_config_value(path, kSection, "tls_ca_path"); !ca.empty()) {
        cfg.tls.caPath = expand_tilde(ca).string();
    }
    if (auto proxy = parse_config_value(path, kSection, "proxy"); !proxy.empty()) {
        cfg.proxy = proxy;
    }

    if (cfg.maxInMemoryReadChunk == 0) {
        spdlog::warn("[Config] cache.max_in_memory_read_chunk = 0, using 1");
        cfg.maxInMemoryReadChunk = 1;
    }

    spdlog::debug("[Config] Loaded cache config from {}", path.string());
    return cfg;
}

} // namespace streamcache::config
