#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace kivybot::engine {

class OperationCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Cancellation signal shared by every suspension point of one job. Not thread-safe:
// cancel and register from the executor that runs the job.
class CancellationToken {
public:
    using Slot = std::function<void()>;

    bool IsCancelled() const { return cancelled_; }
    const std::string& Reason() const { return reason_; }

    // Runs every registered slot once; later calls are ignored.
    void Cancel(const std::string& reason) {
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        reason_ = reason;
        auto slots = std::move(slots_);
        slots_.clear();
        for (auto& entry : slots) {
            if (entry.second) {
                entry.second();
            }
        }
    }

    std::size_t OnCancel(Slot slot) {
        if (cancelled_) {
            if (slot) {
                slot();
            }
            return 0;
        }
        const auto id = ++next_id_;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void Remove(std::size_t id) {
        slots_.erase(id);
    }

    void ThrowIfCancelled() const {
        if (cancelled_) {
            throw OperationCancelled(reason_.empty() ? "operation cancelled" : reason_);
        }
    }

private:
    bool cancelled_ = false;
    std::string reason_;
    std::size_t next_id_ = 0;
    std::map<std::size_t, Slot> slots_;
};

// Scoped OnCancel registration; a null token makes it a no-op.
class CancellationRegistration {
public:
    CancellationRegistration(CancellationToken* token, CancellationToken::Slot slot)
        : token_(token) {
        if (token_) {
            id_ = token_->OnCancel(std::move(slot));
        }
    }

    ~CancellationRegistration() {
        if (token_ && id_ != 0) {
            token_->Remove(id_);
        }
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken* token_ = nullptr;
    std::size_t id_ = 0;
};

// Single deadline timer that cancels a token on expiry. Re-arming moves the deadline.
class Watchdog {
public:
    Watchdog(const boost::asio::any_io_executor& executor, CancellationToken& token)
        : timer_(executor)
        , state_(std::make_shared<State>()) {
        state_->token = &token;
    }

    ~Watchdog() {
        Disarm();
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void ArmUntil(std::chrono::steady_clock::time_point deadline, const std::string& reason) {
        const auto generation = ++state_->generation;
        state_->armed = true;
        state_->reason = reason;
        timer_.expires_at(deadline);
        auto state = state_;
        timer_.async_wait([state, generation](const boost::system::error_code& ec) {
            if (ec || !state->armed || state->generation != generation) {
                return;
            }
            state->fired = true;
            state->token->Cancel(state->reason);
        });
    }

    void Disarm() {
        state_->armed = false;
        ++state_->generation;
        timer_.cancel();
    }

    bool Fired() const { return state_->fired; }

private:
    struct State {
        CancellationToken* token = nullptr;
        std::string reason;
        std::size_t generation = 0;
        bool armed = false;
        bool fired = false;
    };

    boost::asio::steady_timer timer_;
    std::shared_ptr<State> state_;
};

}  // namespace kivybot::engine
