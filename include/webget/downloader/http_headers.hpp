#pragma once

#include <webget/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webget::downloader {

/**
 * Case-insensitive header lookup; the first occurrence wins.
 */
std::optional<std::string_view> findHeader(const std::vector<Header>& headers,
                                           std::string_view name);

/**
 * Copy of headers where a later entry replaces an earlier one with the same
 * (case-insensitive) name. Keeps first-seen order.
 */
std::vector<Header> mergeHeaders(const std::vector<Header>& base,
                                 const std::vector<Header>& overrides);

/**
 * "Name: value" -> Header. nullopt when there is no colon or the name is empty.
 */
std::optional<Header> parseHeaderLine(std::string_view line);

/**
 * Non-negative decimal Content-Length. nullopt on absence of digits, sign, or overflow.
 */
std::optional<std::uint64_t> parseContentLength(std::string_view value);

/**
 * RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT"). nullopt when the value does not
 * match the format exactly.
 */
std::optional<std::chrono::system_clock::time_point> parseHttpDate(std::string_view value);

std::string formatHttpDate(std::chrono::system_clock::time_point when);

/**
 * Raw filename parameter of a Content-Disposition value (filename* preferred over
 * filename). The RFC 5987 charset'language' prefix is removed and the value is
 * percent-decoded; no path stripping or sanitizing happens here.
 */
std::optional<std::string> parseContentDispositionFileName(std::string_view value);

[[nodiscard]] constexpr bool isSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

/**
 * Standard reason phrase for a status, used when the server sends none (HTTP/2).
 */
std::string_view reasonPhraseFor(int status);

/**
 * Collects the response head from raw header lines as the transport delivers them.
 * Each status line ("HTTP/...") starts over, so after a redirect chain only the
 * headers of the final response remain.
 */
class ResponseHeadCollector {
public:
    // One line, with or without its trailing CRLF
    void addLine(std::string_view rawLine);

    /**
     * The collected head. transportStatus, when non-zero, wins over the parsed status;
     * an empty reason falls back to the standard phrase.
     */
    [[nodiscard]] HttpResponseHead head(int transportStatus, std::string effectiveUrl) const;

    [[nodiscard]] int status() const { return status_; }

private:
    int status_{0};
    std::string reason_;
    std::vector<Header> headers_;
};

/**
 * "Name: value" request lines for one attempt. A User-Agent among the extra headers is
 * dropped; the identity is sent as "User-Agent: <identity>", or as "User-Agent:" (the
 * transport then sends no such header) when the identity is empty.
 */
std::vector<std::string> requestHeaderLines(const HttpAttempt& attempt);

} // namespace webget::downloader
