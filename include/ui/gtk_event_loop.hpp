#pragma once

#include <glib.h>
#include <map>
#include <boost/asio/thread_pool.hpp>
#include "event_loop.hpp"

namespace ui {

// EventLoop on the default GLib main context. Background work runs on a
// worker thread that the destructor joins, so a task may post until then.
class GtkEventLoop : public transfer::EventLoop {
public:
    GtkEventLoop() = default;
    ~GtkEventLoop() override;

    GtkEventLoop(const GtkEventLoop&) = delete;
    GtkEventLoop& operator=(const GtkEventLoop&) = delete;

    void post(transfer::Task fn) override;
    transfer::TimerId start_timer(std::chrono::milliseconds interval, transfer::Task fn) override;
    void stop_timer(transfer::TimerId id) override;
    void run_in_background(transfer::Task fn) override;

private:
    struct TimerData {
        GtkEventLoop* loop;
        transfer::TimerId id;
        transfer::Task fn;
    };

    static gboolean on_idle(gpointer data);
    static gboolean on_timeout(gpointer data);
    static void free_timer(gpointer data);

    boost::asio::thread_pool workers_{1};
    std::map<transfer::TimerId, guint> sources_;
    transfer::TimerId next_id_ = 1;
};

} // namespace ui
