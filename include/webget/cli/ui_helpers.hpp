#pragma once

// Shared CLI UI helper utilities for webget
// - TTY detection on stderr
// - Spinner frames and a plain progress bar
//
// Header-only, no external dependencies.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>

#if defined(_WIN32)
#include <io.h>
#define WEBGET_UI_ISATTY _isatty
#define WEBGET_UI_FILENO _fileno
#else
#include <unistd.h>
#define WEBGET_UI_ISATTY isatty
#define WEBGET_UI_FILENO fileno
#endif

namespace webget::cli::ui {

// Progress goes to stderr, so that is the stream that decides line rewriting
inline bool stderr_is_tty() {
#if defined(_WIN32) || defined(__unix__) || defined(__APPLE__)
    return WEBGET_UI_ISATTY(WEBGET_UI_FILENO(stderr));
#else
    return false;
#endif
}

// Spinner frames for indeterminate progress
struct Spinner {
    static constexpr const char* FRAMES[] = {"|", "/", "-", "\\"};
    static constexpr std::size_t FRAME_COUNT = 4;

    static const char* frame(std::size_t index) { return FRAMES[index % FRAME_COUNT]; }
};

// "[=====     ]" for a fraction in [0, 1]
inline std::string progress_bar(double fraction, int width = 30) {
    const double clamped = std::clamp(fraction, 0.0, 1.0);
    const int filled = static_cast<int>(std::llround(clamped * static_cast<double>(width)));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar += "]";
    return bar;
}

} // namespace webget::cli::ui
