#include <webget/downloader/file_naming.hpp>
#include <webget/downloader/http_headers.hpp>

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace webget::downloader {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool is_invalid_file_name_char(unsigned char c) {
    if (c < 0x20 || c == 0x7F)
        return true;
    switch (c) {
        case '"':
        case '<':
        case '>':
        case '|':
        case ':':
        case '*':
        case '?':
        case '\\':
        case '/':
            return true;
        default:
            return false;
    }
}

// Path component of an absolute or relative URL, without query or fragment.
std::string_view url_path(std::string_view url) {
    const auto end = url.find_first_of("?#");
    if (end != std::string_view::npos)
        url = url.substr(0, end);

    const auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
        return url;
    const auto pathStart = url.find('/', scheme + 3);
    if (pathStart == std::string_view::npos)
        return {};
    return url.substr(pathStart);
}

} // namespace

std::string trimWhitespace(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

bool isPlainFileName(std::string_view name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find_first_of("/\\") == std::string_view::npos;
}

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::string sanitizeFileName(std::string_view in) {
    std::string out(in);
    for (auto& c : out) {
        if (is_invalid_file_name_char(static_cast<unsigned char>(c)))
            c = ' ';
    }
    out = trimWhitespace(out);
    if (out == "." || out == "..")
        return {};
    return out;
}

std::string_view lastPathSegment(std::string_view path) {
    const auto slash = path.find_last_of("/\\");
    if (slash == std::string_view::npos)
        return path;
    return path.substr(slash + 1);
}

std::string fileNameFromUrl(std::string_view url) {
    // segment views into trimmed; keep it alive until decoded
    const std::string trimmed = trimWhitespace(url);
    const auto segment = lastPathSegment(url_path(trimmed));
    return sanitizeFileName(percentDecode(segment));
}

std::string fileNameFromContentDisposition(std::string_view headerValue) {
    auto raw = parseContentDispositionFileName(headerValue);
    if (!raw)
        return {};
    return sanitizeFileName(lastPathSegment(*raw));
}

std::string deriveFileName(const std::optional<std::string>& explicitName,
                           std::optional<std::string_view> contentDisposition,
                           std::string_view effectiveUrl, std::string_view originalUrl) {
    if (explicitName) {
        auto name = trimWhitespace(*explicitName);
        if (!name.empty())
            return name;
    }
    if (contentDisposition) {
        auto name = fileNameFromContentDisposition(*contentDisposition);
        if (!name.empty())
            return name;
    }
    if (!effectiveUrl.empty()) {
        auto name = fileNameFromUrl(effectiveUrl);
        if (!name.empty())
            return name;
    }
    return fileNameFromUrl(originalUrl);
}

std::string formatBytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 6> kUnits{"B", "KB", "MB", "GB", "TB", "PB"};
    if (bytes < 1024)
        return fmt::format("{} B", bytes);
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace webget::downloader
