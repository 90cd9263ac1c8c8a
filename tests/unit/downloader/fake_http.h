// In-process fakes for the downloader seams (no network)
#pragma once

#include <webget/downloader/downloader.hpp>
#include <webget/downloader/http_headers.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace webget::tests {

using namespace webget::downloader;

// Scripted response for one attempt
struct FakeResponse {
    int status{200};
    std::string reason{"OK"};
    std::string effectiveUrl; // empty = attempt URL
    std::vector<Header> headers;
    std::string body;
    std::optional<Error> transportError;
    std::optional<std::size_t> failAfterBytes; // body read error once this many bytes were served
};

// Manually advanced steady clock
struct FakeClock {
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::time_point{} +
                                              std::chrono::hours(1)};

    SteadyNow fn() {
        return [this]() { return now; };
    }
    void advance(std::chrono::milliseconds d) { now += d; }
};

class FakeByteStream final : public IByteStream {
public:
    FakeByteStream(HttpResponseHead head, std::string body, std::optional<std::size_t> failAfter,
                   std::size_t maxRead, std::function<void()> onRead)
        : head_(std::move(head)), body_(std::move(body)), failAfter_(failAfter),
          maxRead_(maxRead), onRead_(std::move(onRead)) {}

    Expected<std::size_t> read(std::span<std::byte> buffer) override {
        if (onRead_)
            onRead_();
        if (failAfter_ && pos_ >= *failAfter_) {
            return Error{ErrorCode::NetworkError, "connection reset by peer"};
        }
        std::size_t limit = body_.size();
        if (failAfter_)
            limit = std::min(limit, *failAfter_);
        const std::size_t n = std::min({buffer.size(), limit - pos_, maxRead_});
        if (n > 0) {
            std::memcpy(buffer.data(), body_.data() + pos_, n);
            pos_ += n;
        }
        return n;
    }

    const HttpResponseHead& head() const override { return head_; }

private:
    HttpResponseHead head_;
    std::string body_;
    std::optional<std::size_t> failAfter_;
    std::size_t maxRead_;
    std::function<void()> onRead_;
    std::size_t pos_{0};
};

/**
 * Scripted HTTP adapter. The responder sees every attempt, which is also recorded so
 * tests can assert on identity order and per-attempt headers.
 */
class FakeHttpAdapter final : public IHttpAdapter {
public:
    using Responder = std::function<FakeResponse(const HttpAttempt&)>;

    explicit FakeHttpAdapter(Responder responder) : responder_(std::move(responder)) {}

    static FakeHttpAdapter always(FakeResponse r) {
        return FakeHttpAdapter([r](const HttpAttempt&) { return r; });
    }

    Expected<HttpResponseHead> fetchHead(const HttpAttempt& attempt) override {
        headAttempts.push_back(attempt);
        auto r = responder_(attempt);
        if (r.transportError)
            return *r.transportError;
        if (!isSuccessStatus(r.status))
            return statusError(r);
        return makeHead(attempt, r);
    }

    Expected<std::unique_ptr<IByteStream>> openStream(const HttpAttempt& attempt) override {
        streamAttempts.push_back(attempt);
        if (streamOverride_) {
            auto r = streamOverride_(attempt);
            return finishStream(attempt, r);
        }
        return finishStream(attempt, responder_(attempt));
    }

    // Use a different script for body requests than for header requests
    void setStreamResponder(Responder r) { streamOverride_ = std::move(r); }

    std::size_t maxReadBytes{SIZE_MAX};
    std::function<void()> onRead;

    std::vector<HttpAttempt> headAttempts;
    std::vector<HttpAttempt> streamAttempts;

private:
    static Error statusError(const FakeResponse& r) {
        Error e{ErrorCode::HttpStatus, "HTTP " + std::to_string(r.status) + " " + r.reason};
        e.httpStatus = r.status;
        e.reason = r.reason;
        return e;
    }

    static HttpResponseHead makeHead(const HttpAttempt& attempt, const FakeResponse& r) {
        HttpResponseHead h;
        h.status = r.status;
        h.reason = r.reason;
        h.effectiveUrl = r.effectiveUrl.empty() ? attempt.url : r.effectiveUrl;
        h.headers = r.headers;
        return h;
    }

    Expected<std::unique_ptr<IByteStream>> finishStream(const HttpAttempt& attempt,
                                                        const FakeResponse& r) {
        if (r.transportError)
            return *r.transportError;
        if (!isSuccessStatus(r.status))
            return statusError(r);
        return std::unique_ptr<IByteStream>(std::make_unique<FakeByteStream>(
            makeHead(attempt, r), r.body, r.failAfterBytes, maxReadBytes, onRead));
    }

    Responder responder_;
    Responder streamOverride_;
};

/**
 * Disk writer that delegates to the real one, with failure injection and call records.
 */
class FakeDiskWriter final : public IDiskWriter {
public:
    FakeDiskWriter() : real_(makeDiskWriter()) {}

    Expected<void> ensureDirectory(const std::filesystem::path& dir) override {
        if (failEnsure.count(dir) > 0)
            return Error{ErrorCode::IoError, "permission denied: " + dir.string()};
        return real_->ensureDirectory(dir);
    }

    Expected<std::unique_ptr<ITempFile>> createTempFile(const std::filesystem::path& tempDir,
                                                        std::string_view extension) override {
        if (failCreateTemp)
            return Error{ErrorCode::IoError, "disk full"};
        auto r = real_->createTempFile(tempDir, extension);
        if (r.ok())
            createdTemps.push_back(r.value()->path());
        return r;
    }

    Expected<void> moveIntoPlace(const std::filesystem::path& tempFile,
                                 const std::filesystem::path& destination) override {
        if (failMove)
            return Error{ErrorCode::IoError, "rename refused"};
        return real_->moveIntoPlace(tempFile, destination);
    }

    Expected<void> setModificationTime(const std::filesystem::path& file,
                                       std::chrono::system_clock::time_point when) override {
        mtimeCalls.emplace_back(file, when);
        return real_->setModificationTime(file, when);
    }

    Expected<void> applyProvenance(const std::filesystem::path& file, bool untrusted,
                                   std::string_view sourceUrl) override {
        provenanceCalls.push_back({file, untrusted, std::string(sourceUrl)});
        return Expected<void>{};
    }

    void cleanup(const std::filesystem::path& tempFile) noexcept override {
        cleanedUp.push_back(tempFile);
        real_->cleanup(tempFile);
    }

    struct ProvenanceCall {
        std::filesystem::path file;
        bool untrusted;
        std::string sourceUrl;
    };

    std::set<std::filesystem::path> failEnsure;
    bool failCreateTemp{false};
    bool failMove{false};

    std::vector<std::filesystem::path> createdTemps;
    std::vector<std::filesystem::path> cleanedUp;
    std::vector<std::pair<std::filesystem::path, std::chrono::system_clock::time_point>>
        mtimeCalls;
    std::vector<ProvenanceCall> provenanceCalls;

private:
    std::unique_ptr<IDiskWriter> real_;
};

} // namespace webget::tests
