#include <iomanip>
#include <sstream>
#include <webget/cli/progress_indicator.h>
#include <webget/cli/ui_helpers.hpp>

namespace webget::cli {

using downloader::ProgressEvent;
using downloader::ProgressStage;

ProgressIndicator::ProgressIndicator(Style style, std::ostream& out) : style_(style), out_(out) {}

ProgressIndicator::Style ProgressIndicator::defaultStyle() {
    return ui::stderr_is_tty() ? Style::Bar : Style::Lines;
}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

void ProgressIndicator::onEvent(const ProgressEvent& ev) {
    const auto text = format(ev);
    if (style_ == Style::Lines) {
        out_ << text << '\n' << std::flush;
        return;
    }

    active_ = true;
    out_ << "\r\033[K" << text << std::flush;
    if (ev.stage == ProgressStage::Finalizing) {
        out_ << '\n' << std::flush;
        active_ = false;
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;

    // Clear the line
    out_ << "\r\033[K" << std::flush;
    active_ = false;
}

std::string ProgressIndicator::format(const ProgressEvent& ev) {
    std::ostringstream oss;

    switch (ev.stage) {
        case ProgressStage::Resolving:
            oss << "Resolving " << ev.url;
            return oss.str();
        case ProgressStage::Connecting:
            oss << "Connecting " << ev.url;
            return oss.str();
        case ProgressStage::Downloading:
        case ProgressStage::Finalizing:
            break;
    }

    if (style_ == Style::Lines) {
        oss << ev.activity << ": " << ev.status;
        if (ev.percentage) {
            oss << " (" << static_cast<int>(*ev.percentage) << "%)";
        }
        return oss.str();
    }

    if (ev.percentage) {
        oss << ui::progress_bar(static_cast<double>(*ev.percentage) / 100.0, 20) << " "
            << std::setw(3) << static_cast<int>(*ev.percentage) << "% ";
    } else {
        // Fall back to spinner for indeterminate progress
        oss << ui::Spinner::frame(spinnerIndex_++) << " ";
    }
    oss << ev.activity << "  " << ev.status;
    return oss.str();
}

} // namespace webget::cli
