#pragma once

#include <gtk/gtk.h>
#include <memory>
#include "sender.hpp"
#include "vault.hpp"

namespace ui {

class SendPanel {
public:
    SendPanel(GtkWindow* parent_window,
              std::shared_ptr<vault::EntryStore> store,
              std::shared_ptr<transfer::CryptoBackend> backend,
              std::shared_ptr<media::QrCodec> codec,
              std::shared_ptr<transfer::CaptureGuard> guard,
              transfer::EventLoop& loop,
              std::chrono::milliseconds frame_interval);
    ~SendPanel();

    GtkWidget* get_widget() const { return panel_; }

    // Reloads the entry list and starts over
    void reset();
    void close();

    // Asks for a path and writes the current transfer there
    void save_transfer_file();
    bool file_dialog_open() const { return file_dialog_ != nullptr; }

private:
    GtkWidget* panel_;
    GtkWidget* pages_;
    GtkWindow* parent_window_;
    // Open file chooser, if any; dropped in the destructor
    GtkNativeDialog* file_dialog_ = nullptr;

    // select
    GtkWidget* entry_list_box_;
    GtkWidget* select_all_button_;
    GtkWidget* continue_button_;
    GtkWidget* selection_label_;

    // auth
    GtkWidget* password_entry_;
    GtkWidget* auth_submit_button_;

    // transfer
    GtkWidget* qr_picture_;
    GtkWidget* phrase_label_;
    GtkWidget* frame_label_;
    GtkWidget* protection_label_;

    // error
    GtkWidget* error_label_;

    std::shared_ptr<vault::EntryStore> store_;
    std::unique_ptr<transfer::SenderController> controller_;

    void build_select_page();
    void build_auth_page();
    void build_preparing_page();
    void build_transfer_page();
    void build_error_page();
    void dismiss_file_dialog();

    void on_phase(transfer::SenderPhase phase);
    void on_frame(std::size_t index, const media::Image& image);
    void update_entry_list();
    void sync_selection();

    static void on_entry_toggled(GtkCheckButton* button, gpointer user_data);
    static void on_select_all_clicked(GtkButton* button, gpointer user_data);
    static void on_continue_clicked(GtkButton* button, gpointer user_data);
    static void on_password_activate(GtkWidget* widget, gpointer user_data);
    static void on_back_clicked(GtkButton* button, gpointer user_data);
    static void on_save_clicked(GtkButton* button, gpointer user_data);
    static void on_done_clicked(GtkButton* button, gpointer user_data);
    static void on_retry_clicked(GtkButton* button, gpointer user_data);
};

// Greyscale raster as a texture for GtkPicture. Caller owns the reference.
GdkTexture* texture_from_image(const media::Image& image);

} // namespace ui
