#ifndef COUNTDOWNTIMER_HPP
#define COUNTDOWNTIMER_HPP

#include <iostream>

#include "cancellation.hpp"
#include "progress_bar.hpp"
#include "timer_config.hpp"

class CursorGuard;

enum class TimerOutcome {
    completed,
    interrupted
};

class CountdownTimer {
private:
    TimerConfig config;
    std::ostream& out;
    ProgressBar bar;

    void finish_message();
    TimerOutcome interrupt(CursorGuard& cursor);

public:
    // Throws InvalidConfig when the config cannot drive a timer.
    CountdownTimer(const TimerConfig& config, std::ostream& out = std::cout);

    // Blocks until the full duration has passed or the token is cancelled.
    // The cursor is hidden while this runs and visible again on return,
    // including when an exception escapes.
    TimerOutcome run(const CancellationToken& token);

    const TimerConfig& get_config() const { return config; }
};

#endif // COUNTDOWNTIMER_HPP
