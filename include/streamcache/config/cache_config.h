#pragma once

#include <streamcache/cache/cache.hpp>

#include <filesystem>

namespace streamcache::config {

/**
 * Read the `[cache]` section of a TOML config file into a CacheConfig.
 *
 * Keys that are absent keep their defaults; malformed values are ignored with a warning.
 * Fails with FilesystemError only when the file cannot be opened.
 */
cache::Expected<cache::CacheConfig> loadCacheConfig(const std::filesystem::path& path);

} // namespace streamcache::config
