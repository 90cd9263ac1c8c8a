/*
 * metadata_resolver.cpp
 *
 * Headers-only resolution with identity fallback. Each candidate gets a freshly built
 * attempt; the first 2xx response wins and is normalized into a ResolvedResource.
 */

#include <webget/downloader/file_naming.hpp>
#include <webget/downloader/http_headers.hpp>
#include <webget/downloader/metadata_resolver.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace webget::downloader {

HttpAttempt makeAttempt(std::string_view uri, std::string_view identity,
                        const std::vector<Header>& headers) {
    HttpAttempt attempt;
    attempt.url = std::string(uri);
    attempt.identity = std::string(identity);
    attempt.headers = headers;
    return attempt;
}

ResolvedResource describeResource(std::string_view originalUri, const HttpResponseHead& head,
                                  const std::optional<std::string>& explicitFileName) {
    ResolvedResource res;
    res.originalUri = std::string(originalUri);
    res.absoluteUri = head.effectiveUrl.empty() ? res.originalUri : head.effectiveUrl;

    if (auto cl = findHeader(head.headers, "Content-Length")) {
        res.fileSizeBytes = parseContentLength(*cl);
        if (!res.fileSizeBytes) {
            spdlog::debug("ignoring unparseable Content-Length '{}'", *cl);
        }
    }
    if (auto lm = findHeader(head.headers, "Last-Modified")) {
        res.lastModified = parseHttpDate(*lm);
        if (!res.lastModified) {
            spdlog::debug("ignoring unparseable Last-Modified '{}'", *lm);
        }
    }

    res.fileName = deriveFileName(explicitFileName, findHeader(head.headers, "Content-Disposition"),
                                  res.absoluteUri, res.originalUri);
    return res;
}

namespace {

class MetadataResolver final : public IMetadataResolver {
public:
    explicit MetadataResolver(IHttpAdapter& http) : http_(http) {}

    Expected<ResolvedResource>
    resolve(std::string_view uri, const std::vector<std::string>& identityCandidates,
            const std::vector<Header>& extraHeaders,
            const std::optional<std::string>& explicitFileName) override {
        if (uri.empty()) {
            return Error{ErrorCode::InvalidArgument, "empty URL"};
        }

        Error last{ErrorCode::Resolution, "no identity candidates"};
        for (const auto& identity : identityCandidates) {
            const auto attempt = makeAttempt(uri, identity, extraHeaders);
            spdlog::debug("resolve {} with identity '{}'", uri, identity);

            auto head = http_.fetchHead(attempt);
            if (head.ok()) {
                return describeResource(uri, head.value(), explicitFileName);
            }
            last = head.error();
            spdlog::debug("resolve {} with identity '{}' failed: {}", uri, identity, last.message);
        }

        Error err;
        err.code = ErrorCode::Resolution;
        err.httpStatus = last.httpStatus;
        err.reason = last.reason;
        err.message = "unable to resolve " + std::string(uri) + ": " + last.message;
        return err;
    }

private:
    IHttpAdapter& http_;
};

} // namespace

std::unique_ptr<IMetadataResolver> makeMetadataResolver(IHttpAdapter& http) {
    return std::make_unique<MetadataResolver>(http);
}

} // namespace webget::downloader
