#pragma once

#include <gtk/gtk.h>
#include <memory>
#include "receiver.hpp"

namespace ui {

class ReceivePanel {
public:
    ReceivePanel(GtkWindow* parent_window,
                 std::shared_ptr<transfer::CryptoBackend> backend,
                 std::shared_ptr<media::QrCodec> codec,
                 std::shared_ptr<media::CameraFacility> camera,
                 transfer::EventLoop& loop,
                 std::chrono::milliseconds scan_interval);
    ~ReceivePanel();

    GtkWidget* get_widget() const { return panel_; }

    void reset();
    void close();

    // Asks for a transfer file and imports it
    void open_transfer_file();
    bool file_dialog_open() const { return file_dialog_ != nullptr; }

private:
    GtkWidget* panel_;
    GtkWidget* pages_;
    GtkWindow* parent_window_;
    // Open file chooser, if any; dropped in the destructor
    GtkNativeDialog* file_dialog_ = nullptr;

    GtkWidget* code_entry_;
    GtkWidget* scan_button_;
    GtkWidget* load_button_;

    GtkWidget* progress_bar_;
    GtkWidget* progress_label_;

    GtkWidget* complete_label_;
    GtkWidget* error_label_;
    GtkWidget* camera_label_;

    std::unique_ptr<transfer::ReceiverController> controller_;

    void build_code_page();
    void build_scanning_page();
    void build_importing_page();
    void build_complete_page();
    void build_error_page();
    void dismiss_file_dialog();
    void build_camera_denied_page();

    void on_phase(transfer::ReceiverPhase phase);
    void on_progress(std::size_t received, std::size_t total, std::size_t last_index);

    static void on_code_changed(GtkEditable* editable, gpointer user_data);
    static void on_scan_clicked(GtkButton* button, gpointer user_data);
    static void on_load_clicked(GtkButton* button, gpointer user_data);
    static void on_done_scanning_clicked(GtkButton* button, gpointer user_data);
    static void on_cancel_clicked(GtkButton* button, gpointer user_data);
    static void on_retry_clicked(GtkButton* button, gpointer user_data);
};

} // namespace ui
