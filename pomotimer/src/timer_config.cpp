#include "timer_config.hpp"
#include "errors.hpp"

void validate_config(const TimerConfig& config) {
    if (config.total_seconds < 1) {
        throw InvalidConfig("total_seconds must be >= 1 (got " + std::to_string(config.total_seconds) + ")");
    }
    if (config.bar_width < 1) {
        throw InvalidConfig("bar_width must be >= 1 (got " + std::to_string(config.bar_width) + ")");
    }
    if (!(config.poll_interval > 0.0)) {
        throw InvalidConfig("poll_interval must be positive");
    }
}
