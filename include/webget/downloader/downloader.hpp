#pragma once

/*
 * webget Downloader - Public Types and Component Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * downloader subsystem. It intentionally contains no implementation details.
 *
 * Design principles:
 * - Metadata first: a headers-only GET resolves effective URL, name, size and date
 * - Identity fallback: each request is retried over an ordered list of User-Agent candidates
 * - Streaming copy into a uniquely named temp file, then atomic rename into the destination
 * - Clear separation of concerns (HTTP adapter, metadata resolver, disk writer, engine)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webget::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Progress stages during a single download lifecycle.
 */
enum class ProgressStage { Resolving, Connecting, Downloading, Finalizing };

/**
 * Canonical error codes for downloader operations.
 * The first block is transport level; the second block is the per-item failure taxonomy
 * surfaced by the engine.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    HttpStatus,
    IoError,

    Resolution,
    NoFileName,
    Clobber,
    StreamUnavailable,
    DirectoryCreate,
    TempFile,
    Transfer,
    Finalize,
    Unknown
};

/**
 * Stable identifier for an error code (used in logs and JSON output).
 */
constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NetworkError: return "network_error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::TlsVerificationFailed: return "tls_verification_failed";
        case ErrorCode::HttpStatus: return "http_status";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::Resolution: return "resolution_error";
        case ErrorCode::NoFileName: return "no_file_name";
        case ErrorCode::Clobber: return "clobber";
        case ErrorCode::StreamUnavailable: return "stream_unavailable";
        case ErrorCode::DirectoryCreate: return "directory_create";
        case ErrorCode::TempFile: return "temp_file";
        case ErrorCode::Transfer: return "transfer_error";
        case ErrorCode::Finalize: return "finalize_error";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

// Chunk size used by the streaming copy loop.
inline constexpr std::size_t kDefaultCopyChunkBytes = 80 * 1024;

// Minimum wall-clock spacing between two progress events.
inline constexpr std::chrono::milliseconds kDefaultProgressInterval{250};

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
 * Canonical error object. httpStatus/reason are set when the failure came from a
 * non-success HTTP response.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
    std::string reason{};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Transport configuration for the shared HTTP client.
 * There is no overall deadline: only connect and low-speed timeouts apply.
 */
struct ClientOptions {
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::seconds lowSpeedTimeout{120}; // abort when under 1 B/s for this long; 0 = never
    long maxRedirects{20};
    std::optional<std::string> proxy;
    TlsConfig tls{};
};

/**
 * Default identity candidates: a common browser identity, then a crawler identity.
 */
inline std::vector<std::string> defaultIdentityCandidates() {
    return {"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
            "Chrome/124.0.0.0 Safari/537.36",
            "Googlebot/2.1 (+http://www.google.com/bot.html)"};
}

/**
 * Default extra request headers (accept anything).
 */
inline std::vector<Header> defaultRequestHeaders() {
    return {{"Accept", "*/*"}};
}

/**
 * Downloader default configuration.
 */
struct DownloaderConfig {
    std::vector<std::string> identityCandidates{defaultIdentityCandidates()};
    std::vector<Header> defaultHeaders{defaultRequestHeaders()};
    std::filesystem::path tempDir{}; // empty = platform temp location
    ClientOptions client{};
    std::size_t copyChunkBytes{kDefaultCopyChunkBytes};
    std::chrono::milliseconds progressInterval{kDefaultProgressInterval};
    std::string tempExtension{".tmp"};
    bool keepPartialOnFailure{false};
};

/**
 * Normalized description of a remote resource. Produced once per resolution.
 */
struct ResolvedResource {
    std::string originalUri;
    std::string absoluteUri;
    std::string fileName; // sanitized; empty if undeterminable
    std::optional<std::uint64_t> fileSizeBytes{};
    std::optional<std::chrono::system_clock::time_point> lastModified{};
};

/**
 * A single download request. Read-only to the engine.
 */
struct DownloadRequest {
    std::string uri;
    std::filesystem::path destinationDir{"."};
    std::optional<std::string> explicitFileName{};

    std::vector<std::string> identityCandidates{defaultIdentityCandidates()};
    std::vector<Header> extraHeaders{defaultRequestHeaders()};

    std::filesystem::path tempDir{}; // empty = engine default

    bool ignoreDate{false};
    bool blockFile{false};
    bool noClobber{false};
    bool reportProgress{true};
    bool keepPartialOnFailure{false};
    bool passThru{false};
};

/**
 * Outcome of a successful download.
 */
struct DownloadResult {
    std::string uri;
    std::string absoluteUri;
    std::filesystem::path finalPath;
    std::uint64_t bytesWritten{0};
    bool sizeWasKnown{false};
    std::optional<std::uint64_t> declaredSizeBytes{};
    bool sizeMatched{true};
    std::optional<std::chrono::system_clock::time_point> lastModifiedApplied{};
    std::chrono::milliseconds elapsed{0};
};

/**
 * Throttled progress event for a single URL.
 */
struct ProgressEvent {
    std::string url;
    std::string activity; // "Downloading <fileName>"
    std::string status;   // "1.2 MB of 3.4 MB" / "1.2 MB downloaded"
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<float> percentage{}; // 0.0 - 100.0; absent = indeterminate
    ProgressStage stage{ProgressStage::Downloading};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
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

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// ==========================
// HTTP request/response view
// ==========================

/**
 * One request attempt. Built fresh for every identity candidate so no header state
 * survives between attempts or items.
 */
struct HttpAttempt {
    std::string url;
    std::string identity; // empty = send no User-Agent
    std::vector<Header> headers;
};

/**
 * Status line and headers of the final (post-redirect) response.
 */
struct HttpResponseHead {
    int status{0};
    std::string reason;
    std::string effectiveUrl;
    std::vector<Header> headers;
};

// ==========================
// Service interface classes
// ==========================

/**
 * Pull-style response body. read() returns 0 at end of stream.
 */
class IByteStream {
public:
    virtual ~IByteStream() = default;

    virtual Expected<std::size_t> read(std::span<std::byte> buffer) = 0;
    [[nodiscard]] virtual const HttpResponseHead& head() const = 0;
};

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 * One instance is the shared network client for a whole sequence of items; it is
 * configured once and never mutated by an attempt.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * GET that stops once the final response headers arrive. Non-2xx statuses are
     * returned as ErrorCode::HttpStatus with httpStatus/reason filled.
     */
    virtual Expected<HttpResponseHead> fetchHead(const HttpAttempt& attempt) = 0;

    /**
     * GET that yields the response body as a stream. Succeeds only once the final
     * response status is known to be 2xx.
     */
    virtual Expected<std::unique_ptr<IByteStream>> openStream(const HttpAttempt& attempt) = 0;
};

/**
 * Exclusive write handle on a temp file.
 */
class ITempFile {
public:
    virtual ~ITempFile() = default;

    [[nodiscard]] virtual const std::filesystem::path& path() const = 0;
    virtual Expected<void> write(std::span<const std::byte> data) = 0;
    virtual Expected<void> close() = 0;
};

/**
 * Disk writer for temp files and final placement.
 * Implementations must rename atomically when temp and destination share a filesystem.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create dir and any missing parents.
     */
    virtual Expected<void> ensureDirectory(const std::filesystem::path& dir) = 0;

    /**
     * Create <tempDir>/<unique token><extension> for writing.
     */
    virtual Expected<std::unique_ptr<ITempFile>> createTempFile(const std::filesystem::path& tempDir,
                                                                std::string_view extension) = 0;

    /**
     * Move tempFile to destination, replacing any existing file there.
     * On failure the temp file is left in place and the destination is untouched.
     */
    virtual Expected<void> moveIntoPlace(const std::filesystem::path& tempFile,
                                         const std::filesystem::path& destination) = 0;

    virtual Expected<void> setModificationTime(const std::filesystem::path& file,
                                               std::chrono::system_clock::time_point when) = 0;

    /**
     * Attach (untrusted = true) or clear the platform's downloaded-from-internet marker.
     * No-op where the platform has no such concept.
     */
    virtual Expected<void> applyProvenance(const std::filesystem::path& file, bool untrusted,
                                           std::string_view sourceUrl) = 0;

    /**
     * Best-effort removal of a temp file.
     */
    virtual void cleanup(const std::filesystem::path& tempFile) noexcept = 0;
};

/**
 * Resolves remote metadata with identity fallback.
 */
class IMetadataResolver {
public:
    virtual ~IMetadataResolver() = default;

    /**
     * explicitFileName, when given, wins over Content-Disposition and URL naming.
     */
    virtual Expected<ResolvedResource>
    resolve(std::string_view uri, const std::vector<std::string>& identityCandidates,
            const std::vector<Header>& extraHeaders,
            const std::optional<std::string>& explicitFileName = std::nullopt) = 0;
};

/**
 * Download engine (orchestrates resolver/adapter/disk writer).
 */
class IDownloadEngine {
public:
    virtual ~IDownloadEngine() = default;

    /**
     * Execute a single request.
     */
    virtual Expected<DownloadResult> download(const DownloadRequest& request,
                                              const ProgressCallback& onProgress = {}) = 0;

    /**
     * Execute multiple requests sequentially. A failed item does not stop the batch.
     * Order of results matches the order of requests.
     */
    virtual std::vector<Expected<DownloadResult>>
    downloadMany(const std::vector<DownloadRequest>& requests,
                 const ProgressCallback& onProgress = {}) = 0;

    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

// ==========
// Factories
// ==========

/**
 * Shared libcurl client. Owns global curl state and a connection/DNS/TLS share handle
 * for its whole lifetime; destroy it after the last component using it.
 */
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(const ClientOptions& options);

std::unique_ptr<IDiskWriter> makeDiskWriter();

std::unique_ptr<IMetadataResolver> makeMetadataResolver(IHttpAdapter& http);

/**
 * The engine borrows http; the adapter must outlive the engine.
 */
std::unique_ptr<IDownloadEngine> makeDownloadEngine(IHttpAdapter& http,
                                                    const DownloaderConfig& cfg);

using SteadyNow = std::function<std::chrono::steady_clock::time_point()>;

std::unique_ptr<IDownloadEngine>
makeDownloadEngineWithDependencies(IHttpAdapter& http, const DownloaderConfig& cfg,
                                   std::unique_ptr<IDiskWriter> disk, SteadyNow now = {});

} // namespace webget::downloader
