/*
 * webget/src/downloader/http_headers.cpp
 *
 * Header-level helpers shared by the curl adapter and the metadata resolver:
 * - case-insensitive lookup and merge
 * - Content-Length and RFC 1123 Last-Modified parsing
 * - Content-Disposition filename / filename* extraction (RFC 6266 / RFC 5987)
 */

#include <webget/downloader/file_naming.hpp>
#include <webget/downloader/http_headers.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webget::downloader {

namespace {

constexpr std::array<std::string_view, 7> kWeekdays{"Sun", "Mon", "Tue", "Wed",
                                                     "Thu", "Fri", "Sat"};
constexpr std::array<std::string_view, 12> kMonths{"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

std::string_view trim_view(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

// Parse exactly `width` decimal digits.
std::optional<int> parse_fixed_digits(std::string_view s, size_t pos, size_t width) {
    if (pos + width > s.size())
        return std::nullopt;
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

template <size_t N>
std::optional<int> index_of(const std::array<std::string_view, N>& names, std::string_view token) {
    for (size_t i = 0; i < N; ++i) {
        if (iequals(names[i], token))
            return static_cast<int>(i);
    }
    return std::nullopt;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (m: 1-12).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

// 0 = Sunday; 1970-01-01 was a Thursday
int weekday_from_days(std::int64_t days) {
    return static_cast<int>(((days % 7) + 11) % 7);
}

void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
}

// Unquote a quoted-string, honoring backslash escapes.
std::string unquote_http(std::string_view v) {
    if (v.size() < 2 || v.front() != '"' || v.back() != '"')
        return std::string(v);
    std::string out;
    out.reserve(v.size() - 2);
    for (size_t i = 1; i + 1 < v.size(); ++i) {
        if (v[i] == '\\' && i + 2 < v.size()) {
            ++i;
        }
        out.push_back(v[i]);
    }
    return out;
}

std::string latin1_to_utf8(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

// RFC 5987 ext-value: charset "'" [ language ] "'" value-chars
std::string decode_ext_value(std::string_view raw) {
    std::string v = unquote_http(trim_view(raw));
    const auto first = v.find('\'');
    if (first == std::string::npos) {
        return percentDecode(v);
    }
    const auto second = v.find('\'', first + 1);
    if (second == std::string::npos) {
        return percentDecode(v);
    }
    const std::string_view charset(v.data(), first);
    std::string decoded = percentDecode(std::string_view(v).substr(second + 1));
    if (iequals(charset, "iso-8859-1")) {
        return latin1_to_utf8(decoded);
    }
    return decoded;
}

// Split on ';' outside quoted strings.
std::vector<std::string_view> split_params(std::string_view value) {
    std::vector<std::string_view> parts;
    bool inQuotes = false;
    size_t start = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '\\' && inQuotes) {
            ++i;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == ';' && !inQuotes) {
            parts.push_back(value.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(value.substr(start));
    return parts;
}

} // namespace

std::optional<std::string_view> findHeader(const std::vector<Header>& headers,
                                           std::string_view name) {
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return std::string_view(h.value);
    }
    return std::nullopt;
}

std::vector<Header> mergeHeaders(const std::vector<Header>& base,
                                 const std::vector<Header>& overrides) {
    std::vector<Header> out;
    out.reserve(base.size() + overrides.size());
    auto put = [&out](const Header& h) {
        for (auto& existing : out) {
            if (iequals(existing.name, h.name)) {
                existing.value = h.value;
                return;
            }
        }
        out.push_back(h);
    };
    for (const auto& h : base)
        put(h);
    for (const auto& h : overrides)
        put(h);
    return out;
}

std::optional<Header> parseHeaderLine(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;
    auto name = trim_view(line.substr(0, colon));
    if (name.empty())
        return std::nullopt;
    return Header{std::string(name), std::string(trim_view(line.substr(colon + 1)))};
}

std::optional<std::uint64_t> parseContentLength(std::string_view value) {
    auto sv = trim_view(value);
    if (sv.empty())
        return std::nullopt;
    std::uint64_t tmp{0};
    const char* first = sv.data();
    const char* last = sv.data() + sv.size();
    auto res = std::from_chars(first, last, tmp);
    if (res.ec != std::errc() || res.ptr != last) {
        return std::nullopt;
    }
    return tmp;
}

std::optional<std::chrono::system_clock::time_point> parseHttpDate(std::string_view value) {
    // "Sun, 06 Nov 1994 08:49:37 GMT"
    const auto s = trim_view(value);
    if (s.size() != 29)
        return std::nullopt;
    const auto weekday = index_of(kWeekdays, s.substr(0, 3));
    if (!weekday || s[3] != ',' || s[4] != ' ' || s[7] != ' ' || s[11] != ' ' || s[16] != ' ' ||
        s[19] != ':' || s[22] != ':' || s[25] != ' ' || !iequals(s.substr(26, 3), "GMT")) {
        return std::nullopt;
    }

    const auto day = parse_fixed_digits(s, 5, 2);
    const auto month = index_of(kMonths, s.substr(8, 3));
    const auto year = parse_fixed_digits(s, 12, 4);
    const auto hour = parse_fixed_digits(s, 17, 2);
    const auto minute = parse_fixed_digits(s, 20, 2);
    const auto second = parse_fixed_digits(s, 23, 2);
    if (!day || !month || !year || !hour || !minute || !second)
        return std::nullopt;

    const int m = *month + 1;
    if (*year < 1 || *day < 1 || *day > days_in_month(*year, m) || *hour > 23 || *minute > 59 ||
        *second > 59) {
        return std::nullopt;
    }

    const std::int64_t days =
        days_from_civil(*year, static_cast<unsigned>(m), static_cast<unsigned>(*day));
    if (weekday_from_days(days) != *weekday)
        return std::nullopt;
    const std::int64_t secs = days * 86400 + *hour * 3600 + *minute * 60 + *second;
    return std::chrono::system_clock::time_point{} + std::chrono::seconds(secs);
}

std::string formatHttpDate(std::chrono::system_clock::time_point when) {
    const auto secs =
        std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
    std::int64_t days = secs / 86400;
    std::int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civil_from_days(days, y, m, d);
    const auto wd = static_cast<size_t>(weekday_from_days(days));

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s, %02u %s %04d %02d:%02d:%02d GMT", kWeekdays[wd].data(), d,
                  kMonths[m - 1].data(), y, static_cast<int>(rem / 3600),
                  static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return std::string(buf);
}

std::optional<std::string> parseContentDispositionFileName(std::string_view value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    for (auto part : split_params(value)) {
        part = trim_view(part);
        const auto eq = part.find('=');
        if (eq == std::string_view::npos)
            continue;
        const auto name = trim_view(part.substr(0, eq));
        const auto raw = trim_view(part.substr(eq + 1));
        if (iequals(name, "filename*")) {
            if (!extended)
                extended = decode_ext_value(raw);
        } else if (iequals(name, "filename")) {
            if (!plain) {
                std::string v = unquote_http(raw);
                if (istarts_with(v, "utf-8''")) {
                    plain = decode_ext_value(v);
                } else {
                    plain = percentDecode(v);
                }
            }
        }
    }

    if (extended && !extended->empty())
        return extended;
    if (plain && !plain->empty())
        return plain;
    return std::nullopt;
}

std::string_view reasonPhraseFor(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 429: return "Too Many Requests";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

void ResponseHeadCollector::addLine(std::string_view rawLine) {
    std::string_view line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);
    if (line.empty())
        return;

    if (istarts_with(line, "HTTP/")) {
        status_ = 0;
        reason_.clear();
        headers_.clear();

        const auto sp = line.find(' ');
        if (sp == std::string_view::npos)
            return;
        auto rest = line.substr(sp + 1);
        size_t i = 0;
        int status = 0;
        while (i < rest.size() && i < 3 && rest[i] >= '0' && rest[i] <= '9') {
            status = status * 10 + (rest[i] - '0');
            ++i;
        }
        status_ = status;
        reason_ = std::string(trim_view(rest.substr(i)));
        return;
    }

    if (auto h = parseHeaderLine(line)) {
        headers_.push_back(std::move(*h));
    }
}

HttpResponseHead ResponseHeadCollector::head(int transportStatus, std::string effectiveUrl) const {
    HttpResponseHead out;
    out.status = transportStatus != 0 ? transportStatus : status_;
    out.reason = reason_.empty() ? std::string(reasonPhraseFor(out.status)) : reason_;
    out.effectiveUrl = std::move(effectiveUrl);
    out.headers = headers_;
    return out;
}

std::vector<std::string> requestHeaderLines(const HttpAttempt& attempt) {
    std::vector<std::string> lines;
    lines.reserve(attempt.headers.size() + 1);
    for (const auto& h : attempt.headers) {
        if (iequals(trim_view(h.name), "User-Agent"))
            continue;
        lines.push_back(h.name + ": " + h.value);
    }
    std::string ua = "User-Agent:";
    if (!attempt.identity.empty()) {
        ua.push_back(' ');
        ua.append(attempt.identity);
    }
    lines.push_back(std::move(ua));
    return lines;
}

} // namespace webget::downloader
