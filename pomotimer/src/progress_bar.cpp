#include "progress_bar.hpp"
#include "terminal.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

ColorTier tier_for(double progress) {
    if (progress < 0.33) {
        return ColorTier::early;
    }
    if (progress < 0.66) {
        return ColorTier::middle;
    }
    return ColorTier::late;
}

std::string formatDuration(double seconds) {
    long total = std::lround(seconds);
    long minutes = total / 60;
    long secs = total % 60;
    std::ostringstream formatted;
    formatted << std::setfill('0') << std::setw(2) << minutes << ":"
              << std::setfill('0') << std::setw(2) << secs;
    return formatted.str();
}

ProgressBar::ProgressBar(const TimerConfig& config, std::ostream& out) : config(config), out(out) {
    validate_config(config);
}

int ProgressBar::color_code(ColorTier tier) const {
    switch (tier) {
    case ColorTier::early:
        return config.early_color;
    case ColorTier::middle:
        return config.middle_color;
    case ColorTier::late:
        break;
    }
    return config.late_color;
}

Frame ProgressBar::compute(double elapsed) const {
    const double total = config.total_seconds;
    // Elapsed and remaining are only ever shown inside [0, total]
    double shown = std::min(std::max(elapsed, 0.0), total);
    double progress = std::min(std::max(shown / total, 0.0), 1.0);

    Frame frame;
    frame.progress = progress;
    frame.filled = static_cast<int>(std::lround(progress * config.bar_width));
    frame.filled = std::min(frame.filled, config.bar_width);
    frame.empty = config.bar_width - frame.filled;
    frame.tier = tier_for(progress);
    frame.percent = static_cast<int>(std::lround(progress * 100));
    frame.remaining = formatDuration(total - shown);
    frame.elapsed = formatDuration(shown);
    frame.total = formatDuration(total);
    return frame;
}

std::string ProgressBar::format_line(const Frame& frame) const {
    std::ostringstream line;
    line << config.label << " "
         << frame.remaining << " "
         << "(" << frame.elapsed << "/" << frame.total << ") "
         << std::setfill(' ') << std::setw(3) << frame.percent << "% "
         << ansi::color(color_code(frame.tier))
         << "[" << std::string(frame.filled, '*') << std::string(frame.empty, ' ') << "]"
         << ansi::RESET;
    return line.str();
}

Frame ProgressBar::render(double elapsed) {
    Frame frame = compute(elapsed);
    out << ansi::CLEAR_LINE << format_line(frame) << std::flush;
    return frame;
}

void ProgressBar::close() {
    out << std::endl; // New line after the bar's last frame
}
