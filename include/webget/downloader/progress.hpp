#pragma once

#include <webget/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace webget::downloader {

/**
 * Wall-clock throttle for progress emission. At most one ready() == true per interval.
 * The window starts at construction or restart(), not at the first check.
 */
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval, SteadyNow now = {});

    void restart();
    bool ready();

private:
    std::chrono::steady_clock::time_point now() const;

    std::chrono::milliseconds interval_;
    SteadyNow now_;
    std::chrono::steady_clock::time_point windowStart_;
};

std::optional<float> percentComplete(std::uint64_t written, std::optional<std::uint64_t> total);

ProgressEvent makeProgressEvent(std::string_view url, std::string_view fileName,
                                std::uint64_t written, std::optional<std::uint64_t> total,
                                ProgressStage stage);

} // namespace webget::downloader
