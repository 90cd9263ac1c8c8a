#pragma once

#include <webget/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace webget::cli {

/**
 * Parsed command line of the webget executable.
 */
struct DownloadOptions {
    std::vector<std::string> urls;
    std::string outputDir{"."};
    std::optional<std::string> fileName;
    std::vector<std::string> userAgents; // non-empty replaces the configured candidates
    std::vector<std::string> headers;    // "Name: value"
    std::string tempDir;

    bool ignoreDate{false};
    bool blockFile{false};
    bool noClobber{false};
    bool noProgress{false};
    bool passthru{false};
    bool json{false};
    bool keepPartial{false};
    bool info{false};

    std::string configPath;
    bool verbose{false};
    bool quiet{false};
};

void registerDownloadOptions(CLI::App& app, DownloadOptions& opts);

spdlog::level::level_enum logLevelFor(const DownloadOptions& opts);

/**
 * Built-in defaults, then the config file (if any), then command-line overrides.
 * An explicit --config that cannot be read is an InvalidArgument error.
 */
downloader::Expected<downloader::DownloaderConfig> loadConfig(const DownloadOptions& opts);

/**
 * One request per URL, in command-line order. Fails on a malformed -H value.
 */
downloader::Expected<std::vector<downloader::DownloadRequest>>
buildRequests(const DownloadOptions& opts, const downloader::DownloaderConfig& cfg);

nlohmann::json resourceToJson(const downloader::ResolvedResource& res);
nlohmann::json resultToJson(const downloader::DownloadResult& result);
nlohmann::json errorToJson(const std::string& url, const downloader::Error& err);

/**
 * Process every URL sequentially with one shared HTTP client.
 * Returns 0 when every item succeeded, 1 when any failed, 2 on configuration errors.
 */
int runDownload(const DownloadOptions& opts);

} // namespace webget::cli
