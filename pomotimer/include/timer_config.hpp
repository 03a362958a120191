#ifndef TIMERCONFIG_HPP
#define TIMERCONFIG_HPP

#include <string>

struct TimerConfig {
    int total_seconds = 0;
    std::string label = "TIMER";
    int bar_width = 50;
    // Seconds slept between polls of the clock.
    double poll_interval = 0.01;

    // Foreground color codes for the three progress tiers.
    int early_color = 31;
    int middle_color = 33;
    int late_color = 32;
};

// Throws InvalidConfig for a duration under one second, an empty bar or a
// non-positive poll interval.
void validate_config(const TimerConfig& config);

#endif // TIMERCONFIG_HPP
