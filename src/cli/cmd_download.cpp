/*
 * cmd_download.cpp
 *
 * Command line front end for the downloader.
 * - Options are registered on the root CLI::App (webget has no subcommands).
 * - Config precedence: built-in defaults < config file < command-line flags.
 * - One shared curl client serves every URL; items run sequentially and a failure is
 *   logged without stopping the run.
 * - stdout carries only results (--passthru / --info, human or JSON); progress and logs
 *   go to stderr.
 */

#include <webget/cli/download_command.h>
#include <webget/cli/progress_indicator.h>
#include <webget/config/config_helpers.h>
#include <webget/downloader/download_config.hpp>
#include <webget/downloader/file_naming.hpp>
#include <webget/downloader/http_headers.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace webget::cli {

using namespace webget::downloader;

namespace {

std::optional<std::chrono::system_clock::time_point> file_mtime(const fs::path& p) {
    std::error_code ec;
    const auto ft = fs::last_write_time(p, ec);
    if (ec)
        return std::nullopt;
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ft));
}

void print_resource(const ResolvedResource& res) {
    fmt::print("{:<15} {}\n", "URL:", res.originalUri);
    fmt::print("{:<15} {}\n", "Effective URL:", res.absoluteUri);
    fmt::print("{:<15} {}\n", "File name:", res.fileName.empty() ? "-" : res.fileName);
    fmt::print("{:<15} {}\n", "Size:",
               res.fileSizeBytes ? formatBytes(*res.fileSizeBytes) : std::string("unknown"));
    fmt::print("{:<15} {}\n", "Last-Modified:",
               res.lastModified ? formatHttpDate(*res.lastModified) : std::string("unknown"));
}

void print_result(const DownloadResult& r) {
    const auto mtime = file_mtime(r.finalPath);
    fmt::print("{:<10} {}\n", "Path:", r.finalPath.string());
    fmt::print("{:<10} {} ({} bytes)\n", "Size:", formatBytes(r.bytesWritten), r.bytesWritten);
    fmt::print("{:<10} {}\n", "Modified:", mtime ? formatHttpDate(*mtime) : std::string("-"));
    fmt::print("{:<10} {}\n", "Source:", r.absoluteUri);
}

void report_failure(const DownloadOptions& opts, const std::string& url, const Error& err) {
    spdlog::error("{}: {} ({})", url, err.message, errorCodeName(err.code));
    if (opts.json) {
        fmt::print("{}\n", errorToJson(url, err).dump());
    }
}

int run_info(const DownloadOptions& opts, IHttpAdapter& http,
             const std::vector<DownloadRequest>& requests) {
    auto resolver = makeMetadataResolver(http);
    int rc = 0;
    for (const auto& req : requests) {
        auto res = resolver->resolve(req.uri, req.identityCandidates, req.extraHeaders,
                                     req.explicitFileName);
        if (!res.ok()) {
            report_failure(opts, req.uri, res.error());
            rc = 1;
            continue;
        }
        if (opts.json) {
            fmt::print("{}\n", resourceToJson(res.value()).dump());
        } else {
            print_resource(res.value());
        }
    }
    return rc;
}

} // namespace

void registerDownloadOptions(CLI::App& app, DownloadOptions& opts) {
    app.add_option("urls", opts.urls, "URL(s) to download, processed in order")->required();

    // Destination
    app.add_option("-o,--output-dir", opts.outputDir, "Destination directory (default: cwd)");
    app.add_option("-f,--file-name", opts.fileName,
                   "Explicit file name (single URL; overrides server-provided names)");
    app.add_option("--temp-dir", opts.tempDir, "Directory for in-flight temp files");

    // Request identity and headers
    app.add_option("-A,--user-agent", opts.userAgents,
                   "User-Agent candidate (repeatable, tried in order; \"\" sends none)")
        ->allow_extra_args(false);
    app.add_option("-H,--header", opts.headers, "Extra request header 'Name: value' (repeatable)")
        ->allow_extra_args(false);

    // Behavior
    app.add_flag("--ignore-date", opts.ignoreDate,
                 "Keep the local time instead of the server's Last-Modified");
    app.add_flag("--block-file", opts.blockFile, "Mark the file as downloaded from the internet");
    app.add_flag("--no-clobber", opts.noClobber, "Fail instead of overwriting an existing file");
    app.add_flag("--keep-partial", opts.keepPartial,
                 "Keep the partial temp file when a transfer fails");
    app.add_flag("--info", opts.info, "Resolve and print metadata only; download nothing");

    // Output / UX
    app.add_flag("--no-progress", opts.noProgress, "Do not report progress");
    app.add_flag("--passthru", opts.passthru, "Print a descriptor of each downloaded file");
    app.add_flag("--json", opts.json, "Emit results as JSON on stdout (one object per line)");
    app.add_option("--config", opts.configPath, "Path to config file");
    app.add_flag("-v,--verbose", opts.verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", opts.quiet, "Only report errors");
}

spdlog::level::level_enum logLevelFor(const DownloadOptions& opts) {
    if (opts.verbose)
        return spdlog::level::debug;
    if (opts.quiet)
        return spdlog::level::err;
    return spdlog::level::warn;
}

Expected<DownloaderConfig> loadConfig(const DownloadOptions& opts) {
    DownloaderConfig cfg;

    const auto path = config::get_config_path(opts.configPath);
    std::error_code ec;
    if (!path.empty() && fs::exists(path, ec)) {
        auto loaded = loadDownloaderConfig(path, cfg);
        if (!loaded.ok()) {
            return Error{ErrorCode::InvalidArgument, loaded.error().message};
        }
        cfg = loaded.value();
    } else if (!opts.configPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "config file not found: " + opts.configPath};
    }

    if (!opts.tempDir.empty()) {
        cfg.tempDir = config::expand_tilde(opts.tempDir);
    }
    if (opts.keepPartial) {
        cfg.keepPartialOnFailure = true;
    }
    return cfg;
}

Expected<std::vector<DownloadRequest>> buildRequests(const DownloadOptions& opts,
                                                     const DownloaderConfig& cfg) {
    std::vector<Header> cliHeaders;
    for (const auto& raw : opts.headers) {
        auto h = parseHeaderLine(raw);
        if (!h) {
            return Error{ErrorCode::InvalidArgument, "malformed header '" + raw +
                                                         "' (expected 'Name: value')"};
        }
        cliHeaders.push_back(std::move(*h));
    }
    if (opts.fileName && opts.urls.size() > 1) {
        return Error{ErrorCode::InvalidArgument, "--file-name requires a single URL"};
    }
    if (opts.fileName) {
        const auto name = trimWhitespace(*opts.fileName);
        if (!name.empty() && !isPlainFileName(name)) {
            return Error{ErrorCode::InvalidArgument,
                         "--file-name must be a bare file name, got '" + *opts.fileName + "'"};
        }
    }

    const auto headers = mergeHeaders(cfg.defaultHeaders, cliHeaders);
    const auto identities = opts.userAgents.empty() ? cfg.identityCandidates : opts.userAgents;

    std::vector<DownloadRequest> out;
    out.reserve(opts.urls.size());
    for (const auto& url : opts.urls) {
        DownloadRequest req;
        req.uri = url;
        req.destinationDir = config::expand_tilde(opts.outputDir);
        req.explicitFileName = opts.fileName;
        req.identityCandidates = identities;
        req.extraHeaders = headers;
        req.tempDir = cfg.tempDir;
        req.ignoreDate = opts.ignoreDate;
        req.blockFile = opts.blockFile;
        req.noClobber = opts.noClobber;
        req.reportProgress = !opts.noProgress;
        req.keepPartialOnFailure = cfg.keepPartialOnFailure;
        req.passThru = opts.passthru;
        out.push_back(std::move(req));
    }
    return out;
}

json resourceToJson(const ResolvedResource& res) {
    json j = {{"url", res.originalUri},
              {"effective_url", res.absoluteUri},
              {"file_name", res.fileName},
              {"size_bytes", nullptr},
              {"last_modified", nullptr}};
    if (res.fileSizeBytes)
        j["size_bytes"] = *res.fileSizeBytes;
    if (res.lastModified)
        j["last_modified"] = formatHttpDate(*res.lastModified);
    return j;
}

json resultToJson(const DownloadResult& r) {
    json j = {{"url", r.uri},
              {"effective_url", r.absoluteUri},
              {"path", r.finalPath.string()},
              {"size_bytes", r.bytesWritten},
              {"declared_size_bytes", nullptr},
              {"size_matched", r.sizeMatched},
              {"last_modified", nullptr},
              {"elapsed_ms", r.elapsed.count()},
              {"success", true}};
    if (r.declaredSizeBytes)
        j["declared_size_bytes"] = *r.declaredSizeBytes;
    if (r.lastModifiedApplied)
        j["last_modified"] = formatHttpDate(*r.lastModifiedApplied);
    return j;
}

json errorToJson(const std::string& url, const Error& err) {
    json j = {{"url", url},
              {"success", false},
              {"error", errorCodeName(err.code)},
              {"message", err.message},
              {"http_status", nullptr}};
    if (err.httpStatus)
        j["http_status"] = *err.httpStatus;
    if (!err.reason.empty())
        j["reason"] = err.reason;
    return j;
}

int runDownload(const DownloadOptions& opts) {
    auto cfg = loadConfig(opts);
    if (!cfg.ok()) {
        spdlog::error("{}", cfg.error().message);
        return 2;
    }
    auto requests = buildRequests(opts, cfg.value());
    if (!requests.ok()) {
        spdlog::error("{}", requests.error().message);
        return 2;
    }

    // Shared client; destroyed after the engine below
    auto http = makeCurlHttpAdapter(cfg.value().client);

    if (opts.info) {
        return run_info(opts, *http, requests.value());
    }

    auto engine = makeDownloadEngine(*http, cfg.value());

    std::unique_ptr<ProgressIndicator> progress;
    ProgressCallback onProgress;
    if (!opts.noProgress && !opts.quiet) {
        progress = std::make_unique<ProgressIndicator>(ProgressIndicator::defaultStyle());
        onProgress = [&progress](const ProgressEvent& ev) { progress->onEvent(ev); };
    }

    int rc = 0;
    for (const auto& req : requests.value()) {
        auto r = engine->download(req, onProgress);
        if (progress)
            progress->stop();

        if (!r.ok()) {
            report_failure(opts, req.uri, r.error());
            rc = 1;
            continue;
        }
        if (req.passThru) {
            if (opts.json) {
                fmt::print("{}\n", resultToJson(r.value()).dump());
            } else {
                print_result(r.value());
            }
        }
    }
    return rc;
}

} // namespace webget::cli
