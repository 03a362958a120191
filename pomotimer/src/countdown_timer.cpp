#include "countdown_timer.hpp"
#include "logging.hpp"
#include "terminal.hpp"
#include <chrono>
#include <cmath>
#include <thread>

namespace {

struct TimerState {
    std::chrono::time_point<std::chrono::steady_clock> start_time;
    long last_rendered_sec = -1;
    bool running = false;
};

}  // namespace

CountdownTimer::CountdownTimer(const TimerConfig& config, std::ostream& out)
    : config(config), out(out), bar(config, out) {}

TimerOutcome CountdownTimer::run(const CancellationToken& token) {
    const auto tick = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::duration<double>(config.poll_interval));

    CursorGuard cursor(out);
    TimerState state;
    state.start_time = std::chrono::steady_clock::now();
    state.running = true;
    logger()->debug("timer '{}' started for {}s", config.label, config.total_seconds);

    while (state.running) {
        if (token.is_cancelled()) {
            return interrupt(cursor);
        }

        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - state.start_time).count();
        if (config.total_seconds - elapsed <= 0) {
            state.running = false;
            break;
        }

        // Redraw once per whole second regardless of the poll rate
        long current_sec = static_cast<long>(std::floor(elapsed));
        if (current_sec != state.last_rendered_sec) {
            bar.render(elapsed);
            state.last_rendered_sec = current_sec;
        }

        std::this_thread::sleep_for(tick);
    }

    bar.render(config.total_seconds);
    finish_message();
    // A SIGINT that landed while the last frame or banner was written
    if (token.is_cancelled()) {
        return interrupt(cursor);
    }
    logger()->debug("timer '{}' finished", config.label);
    return TimerOutcome::completed;
}

TimerOutcome CountdownTimer::interrupt(CursorGuard& cursor) {
    out << "\n" << "Interrupted." << "\n";
    cursor.release();
    logger()->debug("timer '{}' interrupted", config.label);
    return TimerOutcome::interrupted;
}

void CountdownTimer::finish_message() {
    bar.close();
    out << ansi::REVERSE << " DONE! " << config.label << " finished. " << ansi::RESET << std::endl;
}
