#pragma once

#include <cstdint>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

namespace transfer {

using TimerId = uint64_t;
using Task = std::function<void()>;

// Single-threaded loop the controllers run on. Everything except
// run_in_background executes on the loop thread.
class EventLoop {
public:
    virtual ~EventLoop() = default;

    // Queue fn to run on the loop thread. Safe from any thread.
    virtual void post(Task fn) = 0;

    // Repeating timer. The next tick is armed only after fn returns.
    virtual TimerId start_timer(std::chrono::milliseconds interval, Task fn) = 0;

    // Unknown or already stopped ids are ignored
    virtual void stop_timer(TimerId id) = 0;

    // Run blocking work off the loop thread; post the result back yourself
    virtual void run_in_background(Task fn) = 0;
};

class AsioEventLoop : public EventLoop {
public:
    explicit AsioEventLoop(boost::asio::io_context& io);
    ~AsioEventLoop() override;

    void post(Task fn) override;
    TimerId start_timer(std::chrono::milliseconds interval, Task fn) override;
    void stop_timer(TimerId id) override;
    void run_in_background(Task fn) override;

private:
    struct Timer {
        boost::asio::steady_timer timer;
        std::chrono::milliseconds interval;
        Task fn;

        Timer(boost::asio::io_context& io, std::chrono::milliseconds iv, Task f)
            : timer(io), interval(iv), fn(std::move(f)) {}
    };

    void arm(TimerId id, std::shared_ptr<Timer> timer);

    boost::asio::io_context& io_;
    boost::asio::thread_pool workers_{1};

    // Touched only on the loop thread
    std::map<TimerId, std::shared_ptr<Timer>> timers_;
    TimerId next_id_ = 1;
};

} // namespace transfer
