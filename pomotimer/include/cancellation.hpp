#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <signal.h>

class CancellationToken {
private:
    std::atomic<bool> cancelled;

public:
    CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Safe to call from a signal handler.
    void cancel() noexcept;
    bool is_cancelled() const noexcept;
};

// Routes SIGINT to a token while alive, then puts the previous handler back.
// Only one adapter may be installed at a time.
class InterruptAdapter {
private:
    struct sigaction previous;

public:
    explicit InterruptAdapter(CancellationToken& token);
    ~InterruptAdapter();

    InterruptAdapter(const InterruptAdapter&) = delete;
    InterruptAdapter& operator=(const InterruptAdapter&) = delete;
};

#endif // CANCELLATION_HPP
