#include "ui/gtk_event_loop.hpp"
#include <boost/asio/post.hpp>
#include <iostream>

namespace ui {

GtkEventLoop::~GtkEventLoop() {
    for (const auto& [id, source] : sources_) {
        g_source_remove(source);
    }
    sources_.clear();
    workers_.join();
}

gboolean GtkEventLoop::on_idle(gpointer data) {
    auto* fn = static_cast<transfer::Task*>(data);
    (*fn)();
    delete fn;
    return G_SOURCE_REMOVE;
}

void GtkEventLoop::post(transfer::Task fn) {
    g_idle_add(on_idle, new transfer::Task(std::move(fn)));
}

gboolean GtkEventLoop::on_timeout(gpointer data) {
    auto* d = static_cast<TimerData*>(data);
    d->fn();
    // The callback may have stopped its own timer
    return d->loop->sources_.count(d->id) ? G_SOURCE_CONTINUE : G_SOURCE_REMOVE;
}

void GtkEventLoop::free_timer(gpointer data) {
    delete static_cast<TimerData*>(data);
}

transfer::TimerId GtkEventLoop::start_timer(std::chrono::milliseconds interval, transfer::Task fn) {
    transfer::TimerId id = next_id_++;
    auto* d = new TimerData{this, id, std::move(fn)};
    guint source = g_timeout_add_full(G_PRIORITY_DEFAULT, static_cast<guint>(interval.count()),
                                      on_timeout, d, free_timer);
    sources_[id] = source;
    return id;
}

void GtkEventLoop::stop_timer(transfer::TimerId id) {
    auto it = sources_.find(id);
    if (it == sources_.end()) return;
    guint source = it->second;
    sources_.erase(it);
    g_source_remove(source);
}

void GtkEventLoop::run_in_background(transfer::Task fn) {
    boost::asio::post(workers_, [fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            std::cerr << "GtkEventLoop: background task failed: " << e.what() << "\n";
        }
    });
}

} // namespace ui
