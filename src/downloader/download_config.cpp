#include <webget/config/config_helpers.h>
#include <webget/downloader/download_config.hpp>
#include <webget/downloader/http_headers.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace webget::downloader {

namespace {

constexpr const char* kSection = "downloader";

template <typename T> std::optional<T> parse_number(const std::string& raw, std::string_view key) {
    T value{};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        spdlog::warn("config: ignoring invalid {}.{} = '{}'", kSection, key, raw);
        return std::nullopt;
    }
    return value;
}

} // namespace

Expected<DownloaderConfig> loadDownloaderConfig(const std::filesystem::path& path,
                                                DownloaderConfig base) {
    {
        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::IoError, "cannot read config file " + path.string()};
        }
    }
    spdlog::debug("loading config from {}", path.string());

    auto value = [&](const char* key) { return config::parse_config_value(path, kSection, key); };

    if (auto raw = value("user_agents"); !raw.empty()) {
        base.identityCandidates = config::parse_string_list(raw);
    }

    if (auto raw = value("headers"); !raw.empty()) {
        std::vector<Header> parsed;
        for (const auto& line : config::parse_string_list(raw)) {
            if (auto h = parseHeaderLine(line)) {
                parsed.push_back(std::move(*h));
            } else {
                spdlog::warn("config: ignoring malformed header '{}'", line);
            }
        }
        base.defaultHeaders = mergeHeaders(base.defaultHeaders, parsed);
    }

    if (auto raw = value("temp_dir"); !raw.empty()) {
        base.tempDir = config::expand_tilde(raw);
    }

    if (auto raw = value("connect_timeout_ms"); !raw.empty()) {
        if (auto v = parse_number<long long>(raw, "connect_timeout_ms"); v && *v >= 0) {
            base.client.connectTimeout = std::chrono::milliseconds(*v);
        }
    }

    if (auto raw = value("low_speed_timeout_s"); !raw.empty()) {
        if (auto v = parse_number<long long>(raw, "low_speed_timeout_s"); v && *v >= 0) {
            base.client.lowSpeedTimeout = std::chrono::seconds(*v);
        }
    }

    if (auto raw = value("max_redirects"); !raw.empty()) {
        if (auto v = parse_number<long>(raw, "max_redirects"); v && *v >= 0) {
            base.client.maxRedirects = *v;
        }
    }

    if (auto raw = value("proxy"); !raw.empty()) {
        base.client.proxy = raw;
    }

    if (auto raw = value("tls_insecure"); !raw.empty()) {
        base.client.tls.insecure = config::parse_bool(raw, base.client.tls.insecure);
    }

    if (auto raw = value("ca_path"); !raw.empty()) {
        base.client.tls.caPath = config::expand_tilde(raw).string();
    }

    if (auto raw = value("chunk_size"); !raw.empty()) {
        if (auto v = parse_number<std::size_t>(raw, "chunk_size"); v && *v > 0) {
            base.copyChunkBytes = *v;
        }
    }

    if (auto raw = value("keep_partial"); !raw.empty()) {
        base.keepPartialOnFailure = config::parse_bool(raw, base.keepPartialOnFailure);
    }

    return base;
}

} // namespace webget::downloader
