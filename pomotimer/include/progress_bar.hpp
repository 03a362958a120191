#ifndef PROGRESSBAR_HPP
#define PROGRESSBAR_HPP

#include <iostream>
#include <string>

#include "timer_config.hpp"

enum class ColorTier {
    early,   // [0, 0.33)
    middle,  // [0.33, 0.66)
    late     // [0.66, 1.0]
};

struct Frame {
    double progress;
    int filled;
    int empty;
    ColorTier tier;
    int percent;
    std::string remaining;
    std::string elapsed;
    std::string total;
};

ColorTier tier_for(double progress);

// Rounds to the nearest second and prints MM:SS. Minutes are not capped.
std::string formatDuration(double seconds);

class ProgressBar {
private:
    TimerConfig config;
    std::ostream& out;

    int color_code(ColorTier tier) const;

public:
    ProgressBar(const TimerConfig& config, std::ostream& out = std::cout);
    Frame compute(double elapsed) const;
    std::string format_line(const Frame& frame) const;
    Frame render(double elapsed);
    void close();
};

#endif // PROGRESSBAR_HPP
