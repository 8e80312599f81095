#include "event_loop.hpp"
#include <boost/asio/post.hpp>
#include <iostream>

namespace transfer {

AsioEventLoop::AsioEventLoop(boost::asio::io_context& io) : io_(io) {}

AsioEventLoop::~AsioEventLoop() {
    for (auto& [id, timer] : timers_) {
        timer->timer.cancel();
    }
    timers_.clear();
    workers_.join();
}

void AsioEventLoop::post(Task fn) {
    boost::asio::post(io_, std::move(fn));
}

TimerId AsioEventLoop::start_timer(std::chrono::milliseconds interval, Task fn) {
    TimerId id = next_id_++;
    auto timer = std::make_shared<Timer>(io_, interval, std::move(fn));
    timers_[id] = timer;
    arm(id, timer);
    return id;
}

void AsioEventLoop::stop_timer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    it->second->timer.cancel();
    timers_.erase(it);
}

void AsioEventLoop::arm(TimerId id, std::shared_ptr<Timer> timer) {
    timer->timer.expires_after(timer->interval);
    timer->timer.async_wait([this, id, timer](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (ec) {
            std::cerr << "EventLoop: timer error: " << ec.message() << "\n";
            return;
        }
        // Stopped while the completion was already queued
        auto it = timers_.find(id);
        if (it == timers_.end() || it->second != timer) return;

        timer->fn();

        // fn may have stopped this timer
        it = timers_.find(id);
        if (it != timers_.end() && it->second == timer) {
            arm(id, timer);
        }
    });
}

void AsioEventLoop::run_in_background(Task fn) {
    boost::asio::post(workers_, std::move(fn));
}

} // namespace transfer
