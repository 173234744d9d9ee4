#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

namespace dply {

class user_cancelled : public std::exception {};

/**
 * @brief Handle SIGINT and SIGTERM by recording a cancellation request. A second signal
 * terminates the process.
 */
void install_signal_handlers() noexcept;

/// Whether SIGINT or SIGTERM has been received
bool is_cancelled() noexcept;

/// Throw user_cancelled if is_cancelled()
void cancellation_point();

/**
 * @brief A cooperative cancellation flag shared between the party requesting cancellation
 * and the deployment pipeline that polls it.
 *
 * Copies of a token share the same flag. A token created with `follow_signals()` also reports
 * cancellation once SIGINT/SIGTERM has been received (see install_signal_handlers()).
 */
class cancel_token {
    struct state {
        std::atomic<bool> requested{false};
        bool              follow_signals = false;
    };

    std::shared_ptr<state> _state = std::make_shared<state>();

public:
    cancel_token() = default;

    static cancel_token follow_signals() noexcept {
        cancel_token ret;
        ret._state->follow_signals = true;
        return ret;
    }

    void request() const noexcept { _state->requested = true; }

    [[nodiscard]] bool is_requested() const noexcept {
        return _state->requested || (_state->follow_signals && dply::is_cancelled());
    }
};

}  // namespace dply
