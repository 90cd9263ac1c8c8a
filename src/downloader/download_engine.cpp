/*
 * download_engine.cpp
 *
 * Per-item pipeline (single stream, sequential):
 * - Resolve metadata over the identity candidates (headers only)
 * - Derive the file name and apply the no-clobber guard before any body transfer
 * - Open the body stream, retrying identities independently of resolution
 * - Copy fixed-size chunks into a uniquely named temp file with throttled progress
 * - Rename into the destination, then apply provenance and modification time
 *
 * Every failure is reported for its item only; downloadMany() continues with the next one.
 */

#include <webget/downloader/downloader.hpp>
#include <webget/downloader/file_naming.hpp>
#include <webget/downloader/http_headers.hpp>
#include <webget/downloader/metadata_resolver.hpp>
#include <webget/downloader/progress.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webget::downloader {

namespace fs = std::filesystem;

namespace {

Error itemError(ErrorCode code, std::string message, const Error* cause = nullptr) {
    Error err;
    err.code = code;
    err.message = std::move(message);
    if (cause != nullptr) {
        if (!cause->message.empty())
            err.message += ": " + cause->message;
        err.httpStatus = cause->httpStatus;
        err.reason = cause->reason;
    }
    return err;
}

class DownloadEngine final : public IDownloadEngine {
public:
    DownloadEngine(IHttpAdapter& http, DownloaderConfig cfg, std::unique_ptr<IDiskWriter> disk,
                   SteadyNow now)
        : http_(http), cfg_(std::move(cfg)), disk_(std::move(disk)), now_(std::move(now)),
          resolver_(makeMetadataResolver(http)) {
        if (cfg_.copyChunkBytes == 0) {
            cfg_.copyChunkBytes = kDefaultCopyChunkBytes;
        }
    }

    Expected<DownloadResult> download(const DownloadRequest& request,
                                      const ProgressCallback& onProgress) override {
        try {
            return run(request, onProgress);
        } catch (const std::exception& ex) {
            spdlog::error("download {} aborted: {}", request.uri, ex.what());
            return Error{ErrorCode::Unknown, std::string("unexpected failure: ") + ex.what()};
        }
    }

    std::vector<Expected<DownloadResult>>
    downloadMany(const std::vector<DownloadRequest>& requests,
                 const ProgressCallback& onProgress) override {
        std::vector<Expected<DownloadResult>> results;
        results.reserve(requests.size());
        for (const auto& req : requests) {
            auto r = download(req, onProgress);
            if (!r.ok()) {
                spdlog::debug("item {} failed ({}); continuing", req.uri,
                              errorCodeName(r.error().code));
            }
            results.push_back(std::move(r));
        }
        return results;
    }

    [[nodiscard]] DownloaderConfig config() const override { return cfg_; }

private:
    std::chrono::steady_clock::time_point now() const {
        return now_ ? now_() : std::chrono::steady_clock::now();
    }

    void emit(const DownloadRequest& req, const ProgressCallback& cb, const std::string& fileName,
              std::uint64_t written, std::optional<std::uint64_t> total, ProgressStage stage) const {
        if (!req.reportProgress || !cb)
            return;
        auto ev = makeProgressEvent(req.uri, fileName, written, total, stage);
        ev.timestamp = now();
        cb(ev);
    }

    fs::path tempDirFor(const DownloadRequest& req) const {
        if (!req.tempDir.empty())
            return req.tempDir;
        if (!cfg_.tempDir.empty())
            return cfg_.tempDir;
        std::error_code ec;
        auto p = fs::temp_directory_path(ec);
        if (ec) {
            spdlog::debug("no platform temp directory ({}); using destination", ec.message());
            return req.destinationDir;
        }
        return p;
    }

    Expected<std::unique_ptr<IByteStream>> openStream(const DownloadRequest& req,
                                                      const std::string& url) {
        Error last{ErrorCode::StreamUnavailable, "no identity candidates"};
        for (const auto& identity : req.identityCandidates) {
            const auto attempt = makeAttempt(url, identity, req.extraHeaders);
            auto s = http_.openStream(attempt);
            if (s.ok()) {
                spdlog::debug("stream {} opened with identity '{}'", url, identity);
                return std::move(s).value();
            }
            last = s.error();
            spdlog::debug("stream {} with identity '{}' failed: {}", url, identity,
                          last.message);
        }
        return itemError(ErrorCode::StreamUnavailable, "unable to open a stream for " + url,
                         &last);
    }

    Expected<DownloadResult> run(const DownloadRequest& req, const ProgressCallback& onProgress) {
        const auto started = now();
        if (req.uri.empty()) {
            return Error{ErrorCode::InvalidArgument, "empty URL"};
        }
        spdlog::info("downloading {}", req.uri);

        // Resolving
        emit(req, onProgress, req.uri, 0, std::nullopt, ProgressStage::Resolving);
        std::optional<std::string> explicitName;
        if (req.explicitFileName) {
            explicitName = trimWhitespace(*req.explicitFileName);
            if (explicitName->empty()) {
                explicitName.reset();
            } else if (!isPlainFileName(*explicitName)) {
                return Error{ErrorCode::InvalidArgument,
                             "file name must not contain a path: " + *explicitName};
            }
        }
        auto resolved =
            resolver_->resolve(req.uri, req.identityCandidates, req.extraHeaders, explicitName);
        if (!resolved.ok()) {
            return itemError(ErrorCode::Resolution, "resolution failed for " + req.uri,
                             &resolved.error());
        }
        const ResolvedResource& res = resolved.value();

        // Naming
        if (res.fileName.empty()) {
            return Error{ErrorCode::NoFileName, "cannot determine a file name for " + req.uri};
        }
        const fs::path destination = req.destinationDir / res.fileName;

        // ClobberCheck
        if (req.noClobber) {
            std::error_code ec;
            if (fs::exists(destination, ec)) {
                return Error{ErrorCode::Clobber,
                             "destination exists and overwrite is disabled: " +
                                 destination.string()};
            }
        }

        // StreamOpening
        emit(req, onProgress, res.fileName, 0, res.fileSizeBytes, ProgressStage::Connecting);
        auto streamRes = openStream(req, res.absoluteUri);
        if (!streamRes.ok()) {
            return streamRes.error();
        }
        std::unique_ptr<IByteStream> stream = std::move(streamRes).value();

        // TempWriting
        const fs::path tempDir = tempDirFor(req);
        for (const auto& dir : {tempDir, req.destinationDir}) {
            auto d = disk_->ensureDirectory(dir);
            if (!d.ok()) {
                return itemError(ErrorCode::DirectoryCreate,
                                 "cannot create directory " + dir.string(), &d.error());
            }
        }

        auto tempRes = disk_->createTempFile(tempDir, cfg_.tempExtension);
        if (!tempRes.ok()) {
            return itemError(ErrorCode::TempFile, "cannot create temp file in " + tempDir.string(),
                             &tempRes.error());
        }
        std::unique_ptr<ITempFile> temp = std::move(tempRes).value();
        const fs::path tempPath = temp->path();
        const bool keepPartial = req.keepPartialOnFailure || cfg_.keepPartialOnFailure;

        auto failTransfer = [&](const Error& cause) -> Error {
            auto closed = temp->close();
            if (!closed.ok()) {
                spdlog::debug("closing {} after failure: {}", tempPath.string(),
                              closed.error().message);
            }
            if (keepPartial) {
                spdlog::warn("partial download kept at {}", tempPath.string());
            } else {
                disk_->cleanup(tempPath);
            }
            return itemError(ErrorCode::Transfer, "transfer failed for " + req.uri, &cause);
        };

        std::vector<std::byte> buffer(cfg_.copyChunkBytes);
        std::uint64_t written = 0;
        ProgressThrottle throttle(cfg_.progressInterval, now_);
        throttle.restart();
        for (;;) {
            auto n = stream->read(std::span<std::byte>(buffer.data(), buffer.size()));
            if (!n.ok()) {
                return failTransfer(n.error());
            }
            if (n.value() == 0)
                break;

            auto w = temp->write(std::span<const std::byte>(buffer.data(), n.value()));
            if (!w.ok()) {
                return failTransfer(w.error());
            }
            written += n.value();

            if (throttle.ready()) {
                emit(req, onProgress, res.fileName, written, res.fileSizeBytes,
                     ProgressStage::Downloading);
            }
        }
        stream.reset();

        auto closed = temp->close();
        if (!closed.ok()) {
            return failTransfer(closed.error());
        }

        // Finalizing
        auto moved = disk_->moveIntoPlace(tempPath, destination);
        if (!moved.ok()) {
            spdlog::warn("temp file left at {}", tempPath.string());
            return itemError(ErrorCode::Finalize, "cannot move download into " +
                                                      destination.string(),
                             &moved.error());
        }

        auto prov = disk_->applyProvenance(destination, req.blockFile, res.absoluteUri);
        if (!prov.ok()) {
            spdlog::warn("provenance marker not updated on {}: {}", destination.string(),
                         prov.error().message);
        }

        DownloadResult out;
        out.uri = req.uri;
        out.absoluteUri = res.absoluteUri;
        out.finalPath = destination;
        out.bytesWritten = written;
        out.sizeWasKnown = res.fileSizeBytes.has_value();
        out.declaredSizeBytes = res.fileSizeBytes;

        if (res.lastModified && !req.ignoreDate) {
            auto t = disk_->setModificationTime(destination, *res.lastModified);
            if (t.ok()) {
                out.lastModifiedApplied = res.lastModified;
            } else {
                spdlog::warn("cannot set modification time on {}: {}", destination.string(),
                             t.error().message);
            }
        }

        if (res.fileSizeBytes && *res.fileSizeBytes != written) {
            out.sizeMatched = false;
            spdlog::warn("{}: server declared {} bytes but {} were written", req.uri,
                         *res.fileSizeBytes, written);
        }

        emit(req, onProgress, res.fileName, written, res.fileSizeBytes, ProgressStage::Finalizing);

        out.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now() - started);
        spdlog::info("saved {} ({} bytes) to {}", req.uri, written, destination.string());
        return out;
    }

    IHttpAdapter& http_;
    DownloaderConfig cfg_;
    std::unique_ptr<IDiskWriter> disk_;
    SteadyNow now_;
    std::unique_ptr<IMetadataResolver> resolver_;
};

} // namespace

std::unique_ptr<IDownloadEngine> makeDownloadEngine(IHttpAdapter& http,
                                                    const DownloaderConfig& cfg) {
    return std::make_unique<DownloadEngine>(http, cfg, makeDiskWriter(), SteadyNow{});
}

std::unique_ptr<IDownloadEngine>
makeDownloadEngineWithDependencies(IHttpAdapter& http, const DownloaderConfig& cfg,
                                   std::unique_ptr<IDiskWriter> disk, SteadyNow now) {
    if (!disk) {
        disk = makeDiskWriter();
    }
    return std::make_unique<DownloadEngine>(http, cfg, std::move(disk), std::move(now));
}

} // namespace webget::downloader
