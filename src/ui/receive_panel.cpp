#include "ui/receive_panel.hpp"
#include "protocol/transfer_file.hpp"
#include <iostream>

namespace ui {

ReceivePanel::ReceivePanel(GtkWindow* parent_window,
                           std::shared_ptr<transfer::CryptoBackend> backend,
                           std::shared_ptr<media::QrCodec> codec,
                           std::shared_ptr<media::CameraFacility> camera,
                           transfer::EventLoop& loop,
                           std::chrono::milliseconds scan_interval)
    : parent_window_(parent_window) {

    panel_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(panel_, 12);
    gtk_widget_set_margin_end(panel_, 12);
    gtk_widget_set_margin_top(panel_, 12);
    gtk_widget_set_margin_bottom(panel_, 12);

    pages_ = gtk_stack_new();
    gtk_stack_set_transition_type(GTK_STACK(pages_), GTK_STACK_TRANSITION_TYPE_CROSSFADE);
    gtk_widget_set_vexpand(pages_, TRUE);
    gtk_box_append(GTK_BOX(panel_), pages_);

    build_code_page();
    build_scanning_page();
    build_importing_page();
    build_complete_page();
    build_error_page();
    build_camera_denied_page();

    transfer::ReceiverCallbacks callbacks;
    callbacks.on_phase = [this](transfer::ReceiverPhase phase) { on_phase(phase); };
    callbacks.on_progress = [this](std::size_t received, std::size_t total, std::size_t last) {
        on_progress(received, total, last);
    };

    controller_ = std::make_unique<transfer::ReceiverController>(
        std::move(backend), std::move(codec), std::move(camera), loop, callbacks, scan_interval);

    reset();
}

ReceivePanel::~ReceivePanel() {
    dismiss_file_dialog();
    controller_.reset();
}

void ReceivePanel::dismiss_file_dialog() {
    if (!file_dialog_) return;
    GtkNativeDialog* dialog = file_dialog_;
    file_dialog_ = nullptr;
    g_signal_handlers_disconnect_by_data(dialog, this);
    gtk_native_dialog_destroy(dialog);
    g_object_unref(dialog);
}

void ReceivePanel::reset() {
    controller_->open();
}

void ReceivePanel::close() {
    controller_->close();
}

// ─── Page construction ──────────────────────────────────────────────────────

void ReceivePanel::build_code_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(page, "section-box");
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    GtkWidget* title = gtk_label_new("Enter the verification phrase");
    gtk_widget_add_css_class(title, "title-text");
    gtk_box_append(GTK_BOX(page), title);

    GtkWidget* hint = gtk_label_new("The sending device shows four words next to the QR code.");
    gtk_widget_add_css_class(hint, "subtitle-text");
    gtk_label_set_wrap(GTK_LABEL(hint), TRUE);
    gtk_box_append(GTK_BOX(page), hint);

    code_entry_ = gtk_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(code_entry_), "word word word word");
    gtk_entry_set_input_hints(GTK_ENTRY(code_entry_), GTK_INPUT_HINT_NO_SPELLCHECK);
    g_signal_connect(code_entry_, "changed", G_CALLBACK(on_code_changed), this);
    gtk_box_append(GTK_BOX(page), code_entry_);

    GtkWidget* btn_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(btn_box, GTK_ALIGN_CENTER);

    scan_button_ = gtk_button_new_with_label("📷 Scan QR Codes");
    gtk_widget_add_css_class(scan_button_, "suggested-action");
    gtk_widget_set_sensitive(scan_button_, FALSE);
    g_signal_connect(scan_button_, "clicked", G_CALLBACK(on_scan_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), scan_button_);

    load_button_ = gtk_button_new_with_label("📄 Load from File");
    gtk_widget_add_css_class(load_button_, "flat");
    gtk_widget_set_sensitive(load_button_, FALSE);
    g_signal_connect(load_button_, "clicked", G_CALLBACK(on_load_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), load_button_);

    gtk_box_append(GTK_BOX(page), btn_box);
    gtk_stack_add_named(GTK_STACK(pages_), page, "code");
}

void ReceivePanel::build_scanning_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    GtkWidget* title = gtk_label_new("Point the camera at the animated QR code");
    gtk_widget_add_css_class(title, "title-text");
    gtk_label_set_wrap(GTK_LABEL(title), TRUE);
    gtk_box_append(GTK_BOX(page), title);

    progress_bar_ = gtk_progress_bar_new();
    gtk_progress_bar_set_show_text(GTK_PROGRESS_BAR(progress_bar_), FALSE);
    gtk_box_append(GTK_BOX(page), progress_bar_);

    progress_label_ = gtk_label_new("Waiting for the first QR code...");
    gtk_widget_add_css_class(progress_label_, "status-text");
    gtk_box_append(GTK_BOX(page), progress_label_);

    GtkWidget* btn_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(btn_box, GTK_ALIGN_CENTER);

    GtkWidget* cancel_button = gtk_button_new_with_label("Cancel");
    gtk_widget_add_css_class(cancel_button, "flat");
    g_signal_connect(cancel_button, "clicked", G_CALLBACK(on_cancel_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), cancel_button);

    GtkWidget* done_button = gtk_button_new_with_label("Done Scanning");
    gtk_widget_add_css_class(done_button, "suggested-action");
    g_signal_connect(done_button, "clicked", G_CALLBACK(on_done_scanning_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), done_button);

    gtk_box_append(GTK_BOX(page), btn_box);
    gtk_stack_add_named(GTK_STACK(pages_), page, "scanning");
}

void ReceivePanel::build_importing_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    GtkWidget* spinner = gtk_spinner_new();
    gtk_spinner_start(GTK_SPINNER(spinner));
    gtk_box_append(GTK_BOX(page), spinner);

    GtkWidget* label = gtk_label_new("Decrypting and importing...");
    gtk_widget_add_css_class(label, "status-text");
    gtk_box_append(GTK_BOX(page), label);

    gtk_stack_add_named(GTK_STACK(pages_), page, "importing");
}

void ReceivePanel::build_complete_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(page, "section-box");
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    complete_label_ = gtk_label_new("");
    gtk_widget_add_css_class(complete_label_, "title-text");
    gtk_box_append(GTK_BOX(page), complete_label_);

    GtkWidget* done_button = gtk_button_new_with_label("Done");
    gtk_widget_add_css_class(done_button, "suggested-action");
    gtk_widget_set_halign(done_button, GTK_ALIGN_CENTER);
    g_signal_connect(done_button, "clicked", G_CALLBACK(on_cancel_clicked), this);
    gtk_box_append(GTK_BOX(page), done_button);

    gtk_stack_add_named(GTK_STACK(pages_), page, "complete");
}

void ReceivePanel::build_error_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(page, "section-box");
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    error_label_ = gtk_label_new("");
    gtk_label_set_wrap(GTK_LABEL(error_label_), TRUE);
    gtk_box_append(GTK_BOX(page), error_label_);

    GtkWidget* retry_button = gtk_button_new_with_label("Try Again");
    gtk_widget_add_css_class(retry_button, "suggested-action");
    gtk_widget_set_halign(retry_button, GTK_ALIGN_CENTER);
    g_signal_connect(retry_button, "clicked", G_CALLBACK(on_retry_clicked), this);
    gtk_box_append(GTK_BOX(page), retry_button);

    gtk_stack_add_named(GTK_STACK(pages_), page, "error");
}

void ReceivePanel::build_camera_denied_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(page, "section-box");
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    GtkWidget* title = gtk_label_new("Camera access is required to scan QR codes");
    gtk_widget_add_css_class(title, "title-text");
    gtk_label_set_wrap(GTK_LABEL(title), TRUE);
    gtk_box_append(GTK_BOX(page), title);

    camera_label_ = gtk_label_new("");
    gtk_widget_add_css_class(camera_label_, "subtitle-text");
    gtk_label_set_wrap(GTK_LABEL(camera_label_), TRUE);
    gtk_box_append(GTK_BOX(page), camera_label_);

    GtkWidget* retry_button = gtk_button_new_with_label("Try Again");
    gtk_widget_add_css_class(retry_button, "suggested-action");
    gtk_widget_set_halign(retry_button, GTK_ALIGN_CENTER);
    g_signal_connect(retry_button, "clicked", G_CALLBACK(on_retry_clicked), this);
    gtk_box_append(GTK_BOX(page), retry_button);

    gtk_stack_add_named(GTK_STACK(pages_), page, "camera-denied");
}

// ─── Controller events ──────────────────────────────────────────────────────

void ReceivePanel::on_phase(transfer::ReceiverPhase phase) {
    switch (phase) {
        case transfer::ReceiverPhase::CODE:
            gtk_editable_set_text(GTK_EDITABLE(code_entry_), "");
            break;
        case transfer::ReceiverPhase::SCANNING:
            gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), 0.0);
            gtk_label_set_text(GTK_LABEL(progress_label_), "Waiting for the first QR code...");
            break;
        case transfer::ReceiverPhase::COMPLETE: {
            std::string text = "✅ Imported " + std::to_string(controller_->imported_count()) + " entries";
            gtk_label_set_text(GTK_LABEL(complete_label_), text.c_str());
            break;
        }
        case transfer::ReceiverPhase::ERROR: {
            std::string text = "❌ " + controller_->error_message();
            gtk_label_set_text(GTK_LABEL(error_label_), text.c_str());
            break;
        }
        case transfer::ReceiverPhase::CAMERA_DENIED:
            gtk_label_set_text(GTK_LABEL(camera_label_), controller_->error_message().c_str());
            break;
        case transfer::ReceiverPhase::IMPORTING:
        case transfer::ReceiverPhase::CLOSED:
            break;
    }
    if (phase != transfer::ReceiverPhase::CLOSED) {
        gtk_stack_set_visible_child_name(GTK_STACK(pages_), transfer::phase_name(phase));
    }
}

void ReceivePanel::on_progress(std::size_t received, std::size_t total, std::size_t last_index) {
    double frac = total > 0 ? static_cast<double>(received) / total : 0.0;
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), frac);

    std::string text = "Received " + std::to_string(received) + " of " + std::to_string(total) +
                       " (last: #" + std::to_string(last_index + 1) + ")";
    gtk_label_set_text(GTK_LABEL(progress_label_), text.c_str());
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void ReceivePanel::on_code_changed(GtkEditable* editable, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    bool valid = self->controller_->set_verification_code(gtk_editable_get_text(editable));
    gtk_widget_set_sensitive(self->scan_button_, valid);
    gtk_widget_set_sensitive(self->load_button_, valid);
}

void ReceivePanel::on_scan_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    self->controller_->start_scanning();
}

void ReceivePanel::on_load_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<ReceivePanel*>(user_data)->open_transfer_file();
}

void ReceivePanel::open_transfer_file() {
    dismiss_file_dialog();

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* native = gtk_file_chooser_native_new(
        "Open Transfer File", parent_window_,
        GTK_FILE_CHOOSER_ACTION_OPEN, "_Open", "_Cancel");

    GtkFileFilter* filter = gtk_file_filter_new();
    gtk_file_filter_set_name(filter, "Transfer files");
    std::string pattern = std::string("*") + protocol::TRANSFER_FILE_EXTENSION;
    gtk_file_filter_add_pattern(filter, pattern.c_str());
    gtk_file_chooser_add_filter(GTK_FILE_CHOOSER(native), filter);
    g_object_unref(filter);

    g_signal_connect(native, "response", G_CALLBACK(+[](GtkNativeDialog* dialog, int response, gpointer data) {
        auto* panel = static_cast<ReceivePanel*>(data);
        if (response == GTK_RESPONSE_ACCEPT) {
            GFile* file = gtk_file_chooser_get_file(GTK_FILE_CHOOSER(dialog));
            char* path = file ? g_file_get_path(file) : nullptr;
            if (path) {
                panel->controller_->load_file(path);
                g_free(path);
            }
            if (file) g_object_unref(file);
        }
        panel->file_dialog_ = nullptr;
        g_object_unref(dialog);
    }), this);

    file_dialog_ = GTK_NATIVE_DIALOG(native);
    gtk_native_dialog_show(GTK_NATIVE_DIALOG(native));
G_GNUC_END_IGNORE_DEPRECATIONS
}

void ReceivePanel::on_done_scanning_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    self->controller_->finish_scanning();
}

void ReceivePanel::on_cancel_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    self->controller_->close();
    self->reset();
}

void ReceivePanel::on_retry_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    self->controller_->retry();
}

} // namespace ui
