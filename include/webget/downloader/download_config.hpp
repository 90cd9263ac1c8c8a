#pragma once

#include <webget/downloader/downloader.hpp>

#include <filesystem>

namespace webget::downloader {

/**
 * Apply the [downloader] section of a TOML-style config file on top of base.
 *
 * Recognized keys: user_agents, headers, temp_dir, connect_timeout_ms, low_speed_timeout_s,
 * max_redirects, proxy, tls_insecure, ca_path, chunk_size, keep_partial.
 * Absent keys keep the base value; malformed values are logged and ignored.
 * Fails only when the file cannot be read.
 */
Expected<DownloaderConfig> loadDownloaderConfig(const std::filesystem::path& path,
                                                DownloaderConfig base = {});

} // namespace webget::downloader
