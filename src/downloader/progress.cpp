#include <webget/downloader/file_naming.hpp>
#include <webget/downloader/progress.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace webget::downloader {

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval, SteadyNow now)
    : interval_(interval), now_(std::move(now)) {
    restart();
}

void ProgressThrottle::restart() {
    windowStart_ = now();
}

bool ProgressThrottle::ready() {
    const auto t = now();
    if (t - windowStart_ < interval_)
        return false;
    windowStart_ = t;
    return true;
}

std::chrono::steady_clock::time_point ProgressThrottle::now() const {
    return now_ ? now_() : std::chrono::steady_clock::now();
}

std::optional<float> percentComplete(std::uint64_t written, std::optional<std::uint64_t> total) {
    if (!total || *total == 0)
        return std::nullopt;
    const long double pct =
        (static_cast<long double>(written) * 100.0L) / static_cast<long double>(*total);
    return static_cast<float>(std::min<long double>(pct, 100.0L));
}

ProgressEvent makeProgressEvent(std::string_view url, std::string_view fileName,
                                std::uint64_t written, std::optional<std::uint64_t> total,
                                ProgressStage stage) {
    ProgressEvent ev;
    ev.url = std::string(url);
    ev.activity = "Downloading " + std::string(fileName);
    if (total) {
        ev.status = formatBytes(written) + " of " + formatBytes(*total);
    } else {
        ev.status = formatBytes(written) + " downloaded";
    }
    ev.downloadedBytes = written;
    ev.totalBytes = total;
    ev.percentage = percentComplete(written, total);
    ev.stage = stage;
    return ev;
}

} // namespace webget::downloader
