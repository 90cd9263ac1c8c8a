#pragma once

#include <webget/downloader/downloader.hpp>

#include <cstddef>
#include <iostream>
#include <string>

namespace webget::cli {

/**
 * @brief Renders downloader progress events on a side channel (stderr by default)
 *
 * On a terminal the indicator rewrites a single line in place; otherwise it writes one
 * plain line per event so logs stay readable.
 */
class ProgressIndicator {
public:
    enum class Style {
        Bar,  // [=====     ]  45% Downloading a.zip  1.2 MB of 2.7 MB
        Lines // Downloading a.zip: 1.2 MB of 2.7 MB (45%)
    };

    /**
     * @brief Construct a progress indicator
     * @param style The visual style to use
     * @param out Stream to render on
     */
    explicit ProgressIndicator(Style style, std::ostream& out = std::cerr);

    /**
     * @brief Bar on a terminal stderr, Lines otherwise
     */
    static Style defaultStyle();

    /**
     * @brief Destructor - clears an in-place line if one is showing
     */
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    void onEvent(const downloader::ProgressEvent& ev);

    /**
     * @brief Clear the indicator line (Bar style)
     */
    void stop();

    bool isActive() const { return active_; }

    // Text for one event, without the carriage return or line clearing.
    std::string format(const downloader::ProgressEvent& ev);

private:
    Style style_;
    std::ostream& out_;
    bool active_ = false;
    std::size_t spinnerIndex_ = 0;
};

} // namespace webget::cli
