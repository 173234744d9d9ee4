#include "./signal.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t got_signal = 0;

// The first signal asks the running deployment to stop after the files in flight. A second one
// terminates the process.
void handle_signal(int sig) {
    if (got_signal != 0) {
        std::signal(sig, SIG_DFL);
        std::raise(sig);
        return;
    }
    got_signal = sig;
}

}  // namespace

using namespace dply;

void dply::install_signal_handlers() noexcept {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

bool dply::is_cancelled() noexcept { return got_signal != 0; }

void dply::cancellation_point() {
    if (is_cancelled()) {
        throw user_cancelled();
    }
}
