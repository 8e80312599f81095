#pragma once

#include <gtk/gtk.h>
#include <memory>
#include "config.hpp"
#include "vault.hpp"
#include "backend.hpp"
#include "capture_guard.hpp"
#include "media/camera.hpp"
#include "media/qr_codec.hpp"
#include "ui/gtk_event_loop.hpp"

namespace ui {

class SendPanel;
class ReceivePanel;

class MainWindow {
public:
    MainWindow(GtkApplication* app, const config::Config& cfg);
    ~MainWindow();

    GtkWidget* get_window() const { return window_; }

private:
    GtkWidget* window_;
    GtkWidget* stack_;
    GtkWidget* header_bar_;

    GtkEventLoop loop_;
    std::shared_ptr<vault::EntryStore> store_;
    std::shared_ptr<transfer::CryptoBackend> backend_;
    std::shared_ptr<media::QrCodec> codec_;

    SendPanel* send_panel_;
    ReceivePanel* receive_panel_;

    void setup_css();
    static void on_destroy(GtkWidget* widget, gpointer data);
    static void on_page_changed(GObject* stack, GParamSpec* pspec, gpointer data);
};

// Throws std::runtime_error if the vault cannot be opened
int run_gui(const config::Config& cfg);

} // namespace ui
