#include "syncwatch/client/scheduler.hpp"

#include <boost/asio/steady_timer.hpp>

namespace syncwatch::client {

namespace asio = boost::asio;

AsioScheduler::AsioScheduler(asio::io_context& io) : io_(io) {}

TimerHandle AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    auto timer = std::make_shared<asio::steady_timer>(io_, delay);
    auto state = std::make_shared<TimerState>();

    std::weak_ptr<asio::steady_timer> weak_timer = timer;
    state->on_cancel = [weak_timer]() {
        if (auto t = weak_timer.lock()) {
            t->cancel();
        }
    };

    // The timer keeps itself alive through its own completion handler
    timer->async_wait([timer, state, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || state->cancelled) {
            return;
        }
        state->fired = true;
        state->on_cancel = nullptr;
        task();
    });

    return TimerHandle(state);
}

} // namespace syncwatch::client
