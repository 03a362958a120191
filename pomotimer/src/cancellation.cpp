#include "cancellation.hpp"
#include "logging.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <signal.h>

static_assert(ATOMIC_BOOL_LOCK_FREE == 2, "signal handler needs a lock-free flag");
static_assert(ATOMIC_POINTER_LOCK_FREE == 2, "signal handler needs a lock-free token slot");

namespace {

std::atomic<CancellationToken*> active_token{nullptr};

extern "C" void on_interrupt(int) {
    CancellationToken* token = active_token.load();
    if (token != nullptr) {
        token->cancel();
    }
}

}  // namespace

CancellationToken::CancellationToken() : cancelled(false) {}

void CancellationToken::cancel() noexcept {
    cancelled.store(true);
}

bool CancellationToken::is_cancelled() const noexcept {
    return cancelled.load();
}

InterruptAdapter::InterruptAdapter(CancellationToken& token) {
    CancellationToken* expected = nullptr;
    if (!active_token.compare_exchange_strong(expected, &token)) {
        throw std::logic_error("InterruptAdapter : an adapter is already installed");
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    // Let the poll sleep resume; the loop checks the token right after it.
    action.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &action, &previous) != 0) {
        int err = errno;
        active_token.store(nullptr);
        throw std::system_error(err, std::generic_category(), "sigaction(SIGINT)");
    }
}

InterruptAdapter::~InterruptAdapter() {
    if (sigaction(SIGINT, &previous, nullptr) != 0) {
        logger()->warn("could not restore the SIGINT handler: {}", std::strerror(errno));
    }
    active_token.store(nullptr);
}
