/**
 * @file scheduler.hpp
 * @brief Delayed-task scheduling used for reconnect backoff and keepalive
 *
 * The client never sleeps or blocks. Anything that waits goes through a
 * Scheduler, so tests can swap in a manual clock and production code runs
 * on an io_context.
 */

#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace syncwatch::client {

struct TimerState {
    bool cancelled = false;
    bool fired = false;
    std::function<void()> on_cancel;
};

/**
 * @brief Handle to one scheduled task
 *
 * Default-constructed handles refer to nothing; cancel() on them is a no-op.
 * Cancelling a task that already ran does nothing.
 */
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<TimerState> state) : state_(std::move(state)) {}

    void cancel() {
        if (!state_ || state_->cancelled || state_->fired) {
            return;
        }
        state_->cancelled = true;
        if (auto on_cancel = std::move(state_->on_cancel)) {
            on_cancel();
        }
    }

    [[nodiscard]] bool pending() const {
        return state_ && !state_->cancelled && !state_->fired;
    }

private:
    std::shared_ptr<TimerState> state_;
};

class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /// Runs task once after delay unless the returned handle is cancelled first
    virtual TimerHandle schedule(std::chrono::milliseconds delay, Task task) = 0;
};

/**
 * @brief Scheduler backed by boost::asio::steady_timer
 *
 * Tasks run on whichever thread is running the io_context.
 */
class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& io);

    TimerHandle schedule(std::chrono::milliseconds delay, Task task) override;

private:
    boost::asio::io_context& io_;
};

} // namespace syncwatch::client
