#pragma once
// Coordinator-wide stop signal plus optional per-operation deadline.
//
// CancellationSource owns the shared stop flag. Tokens are cheap copies that
// observe it; a token derived with with_timeout() additionally expires at a
// fixed steady_clock deadline. Tokens are checked at task start, while waiting
// for a pool lease, during the settle delay and at every batch boundary.
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace credingest {

namespace detail {
struct CancelState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};
} // namespace detail

class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    // A token that is never cancelled and never expires
    CancellationToken() : state_(std::make_shared<detail::CancelState>()) {}

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    [[nodiscard]] bool is_expired() const {
        return has_deadline_ && Clock::now() >= deadline_;
    }

    // Cancelled or past the deadline
    [[nodiscard]] bool stop_requested() const { return is_cancelled() || is_expired(); }

    // Same stop signal, deadline = min(current deadline, now + timeout)
    [[nodiscard]] CancellationToken with_timeout(std::chrono::milliseconds timeout) const {
        CancellationToken child(*this);
        auto candidate = Clock::now() + timeout;
        if (!child.has_deadline_ || candidate < child.deadline_) {
            child.deadline_ = candidate;
            child.has_deadline_ = true;
        }
        return child;
    }

    // Sleeps up to `d` (bounded by the deadline). Returns false if the wait
    // ended because of cancellation or expiry.
    bool wait_for(std::chrono::milliseconds d) const {
        auto until = Clock::now() + d;
        if (has_deadline_ && deadline_ < until) until = deadline_;

        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
        if (state_->cancelled) return false;
        return !(has_deadline_ && Clock::now() >= deadline_);
    }

    [[nodiscard]] bool has_deadline() const { return has_deadline_; }
    [[nodiscard]] Clock::time_point deadline() const { return deadline_; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
    Clock::time_point deadline_{};
    bool has_deadline_ = false;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancelState>()) {}

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace credingest
