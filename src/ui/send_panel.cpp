#include "ui/send_panel.hpp"
#include "protocol/transfer_file.hpp"
#include "security.hpp"
#include <iostream>

namespace ui {

GdkTexture* texture_from_image(const media::Image& image) {
    if (image.empty()) return nullptr;

    // GdkMemoryTexture has no single-channel 8-bit format before GTK 4.12
    const gsize stride = static_cast<gsize>(image.width) * 3;
    auto* rgb = static_cast<guchar*>(g_malloc(stride * image.height));
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        rgb[i * 3] = rgb[i * 3 + 1] = rgb[i * 3 + 2] = image.pixels[i];
    }
    GBytes* bytes = g_bytes_new_take(rgb, stride * image.height);
    GdkTexture* texture = gdk_memory_texture_new(image.width, image.height,
                                                 GDK_MEMORY_R8G8B8, bytes, stride);
    g_bytes_unref(bytes);
    return texture;
}

// ─── SendPanel ──────────────────────────────────────────────────────────────

SendPanel::SendPanel(GtkWindow* parent_window,
                     std::shared_ptr<vault::EntryStore> store,
                     std::shared_ptr<transfer::CryptoBackend> backend,
                     std::shared_ptr<media::QrCodec> codec,
                     std::shared_ptr<transfer::CaptureGuard> guard,
                     transfer::EventLoop& loop,
                     std::chrono::milliseconds frame_interval)
    : parent_window_(parent_window), store_(std::move(store)) {

    panel_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(panel_, 12);
    gtk_widget_set_margin_end(panel_, 12);
    gtk_widget_set_margin_top(panel_, 12);
    gtk_widget_set_margin_bottom(panel_, 12);

    pages_ = gtk_stack_new();
    gtk_stack_set_transition_type(GTK_STACK(pages_), GTK_STACK_TRANSITION_TYPE_CROSSFADE);
    gtk_widget_set_vexpand(pages_, TRUE);
    gtk_box_append(GTK_BOX(panel_), pages_);

    build_select_page();
    build_auth_page();
    build_preparing_page();
    build_transfer_page();
    build_error_page();

    transfer::SenderCallbacks callbacks;
    callbacks.on_phase = [this](transfer::SenderPhase phase) { on_phase(phase); };
    callbacks.on_frame = [this](std::size_t index, const media::Image& image) { on_frame(index, image); };

    controller_ = std::make_unique<transfer::SenderController>(
        std::move(backend), std::move(codec), std::move(guard), loop, callbacks, frame_interval);

    reset();
}

SendPanel::~SendPanel() {
    dismiss_file_dialog();
    controller_.reset();
}

void SendPanel::dismiss_file_dialog() {
    if (!file_dialog_) return;
    GtkNativeDialog* dialog = file_dialog_;
    file_dialog_ = nullptr;
    g_signal_handlers_disconnect_by_data(dialog, this);
    gtk_native_dialog_destroy(dialog);
    g_object_unref(dialog);
}

void SendPanel::reset() {
    controller_->open(store_->list());
}

void SendPanel::close() {
    controller_->close();
}

// ─── Page construction ──────────────────────────────────────────────────────

void SendPanel::build_select_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);

    GtkWidget* title = gtk_label_new("Choose entries to send");
    gtk_widget_add_css_class(title, "title-text");
    gtk_box_append(GTK_BOX(page), title);

    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 200);
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);

    entry_list_box_ = gtk_list_box_new();
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(entry_list_box_), GTK_SELECTION_NONE);
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), entry_list_box_);
    gtk_box_append(GTK_BOX(page), scroll);

    selection_label_ = gtk_label_new("");
    gtk_widget_add_css_class(selection_label_, "status-text");
    gtk_box_append(GTK_BOX(page), selection_label_);

    GtkWidget* btn_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(btn_box, GTK_ALIGN_CENTER);

    select_all_button_ = gtk_button_new_with_label("Select All");
    gtk_widget_add_css_class(select_all_button_, "flat");
    g_signal_connect(select_all_button_, "clicked", G_CALLBACK(on_select_all_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), select_all_button_);

    continue_button_ = gtk_button_new_with_label("Continue");
    gtk_widget_add_css_class(continue_button_, "suggested-action");
    gtk_widget_set_sensitive(continue_button_, FALSE);
    g_signal_connect(continue_button_, "clicked", G_CALLBACK(on_continue_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), continue_button_);

    gtk_box_append(GTK_BOX(page), btn_box);
    gtk_stack_add_named(GTK_STACK(pages_), page, "select");
}

void SendPanel::build_auth_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(page, "section-box");
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    GtkWidget* title = gtk_label_new("Confirm your master password");
    gtk_widget_add_css_class(title, "title-text");
    gtk_box_append(GTK_BOX(page), title);

    GtkWidget* hint = gtk_label_new("Seed phrases and recovery codes need re-authentication.");
    gtk_widget_add_css_class(hint, "subtitle-text");
    gtk_label_set_wrap(GTK_LABEL(hint), TRUE);
    gtk_box_append(GTK_BOX(page), hint);

    password_entry_ = gtk_password_entry_new();
    gtk_password_entry_set_show_peek_icon(GTK_PASSWORD_ENTRY(password_entry_), TRUE);
    g_signal_connect(password_entry_, "activate", G_CALLBACK(on_password_activate), this);
    gtk_box_append(GTK_BOX(page), password_entry_);

    GtkWidget* btn_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(btn_box, GTK_ALIGN_CENTER);

    GtkWidget* back_button = gtk_button_new_with_label("Back");
    gtk_widget_add_css_class(back_button, "flat");
    g_signal_connect(back_button, "clicked", G_CALLBACK(on_back_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), back_button);

    auth_submit_button_ = gtk_button_new_with_label("Confirm");
    gtk_widget_add_css_class(auth_submit_button_, "suggested-action");
    g_signal_connect(auth_submit_button_, "clicked", G_CALLBACK(on_password_activate), this);
    gtk_box_append(GTK_BOX(btn_box), auth_submit_button_);

    gtk_box_append(GTK_BOX(page), btn_box);
    gtk_stack_add_named(GTK_STACK(pages_), page, "auth");
}

void SendPanel::build_preparing_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_valign(page, GTK_ALIGN_CENTER);

    GtkWidget* spinner = gtk_spinner_new();
    gtk_spinner_start(GTK_SPINNER(spinner));
    gtk_box_append(GTK_BOX(page), spinner);

    GtkWidget* label = gtk_label_new("Encrypting entries...");
    gtk_widget_add_css_class(label, "status-text");
    gtk_box_append(GTK_BOX(page), label);

    gtk_stack_add_named(GTK_STACK(pages_), page, "preparing");
}

void SendPanel::build_transfer_page() {
    GtkWidget* page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);

    qr_picture_ = gtk_picture_new();
    gtk_picture_set_content_fit(GTK_PICTURE(qr_picture_), GTK_CONTENT_FIT_CONTAIN);
    gtk_widget_set_size_request(qr_picture_, 320, 320);
    gtk_widget_set_vexpand(qr_picture_, TRUE);
    gtk_widget_add_css_class(qr_picture_, "qr-frame");
    gtk_box_append(GTK_BOX(page), qr_picture_);

    frame_label_ = gtk_label_new("");
    gtk_widget_add_css_class(frame_label_, "status-text");
    gtk_box_append(GTK_BOX(page), frame_label_);

    GtkWidget* hint = gtk_label_new("Type this phrase on the receiving device:");
    gtk_widget_add_css_class(hint, "subtitle-text");
    gtk_box_append(GTK_BOX(page), hint);

    phrase_label_ = gtk_label_new("");
    gtk_widget_add_css_class(phrase_label_, "pin-display");
    gtk_label_set_selectable(GTK_LABEL(phrase_label_), FALSE);
    gtk_box_append(GTK_BOX(page), phrase_label_);

    protection_label_ = gtk_label_new("");
    gtk_widget_add_css_class(protection_label_, "subtitle-text");
    gtk_label_set_wrap(GTK_LABEL(protection_label_), TRUE);
    gtk_box_append(GTK_BOX(page), protection_label_);

    GtkWidget* btn_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(btn_box, GTK_ALIGN_CENTER);

    GtkWidget* save_button = gtk_button_new_with_label("Save to File");
    gtk_widget_add_css_class(save_button, "flat");
    g_signal_connect(save_button, "clicked", G_CALLBACK(on_save_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), save_button);

    GtkWidget* done_button = gtk_button_new_with_label("Done");
    gtk_widget_add_css_class(done_button, "destructive-action");
    g_signal_connect(done_button, "clicked", G_CALLBACK(on_done_clicked), this);
    gtk_box_append(GTK_BOX(btn_box), done_button);

    gtk_box_append(GTK_BOX(page), btn_box);
    gtk_stack_add_named(GTK_STACK(pages_), page, "transfer");
}

void SendPanel::build_error_page() {
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

// ─── Controller events ──────────────────────────────────────────────────────

void SendPanel::on_phase(transfer::SenderPhase phase) {
    switch (phase) {
        case transfer::SenderPhase::SELECT:
            update_entry_list();
            gtk_stack_set_visible_child_name(GTK_STACK(pages_), "select");
            break;
        case transfer::SenderPhase::AUTH:
            gtk_editable_set_text(GTK_EDITABLE(password_entry_), "");
            gtk_stack_set_visible_child_name(GTK_STACK(pages_), "auth");
            gtk_widget_grab_focus(password_entry_);
            break;
        case transfer::SenderPhase::PREPARING:
            gtk_stack_set_visible_child_name(GTK_STACK(pages_), "preparing");
            break;
        case transfer::SenderPhase::TRANSFER: {
            gtk_label_set_text(GTK_LABEL(phrase_label_), controller_->verification_code().c_str());
            gtk_label_set_text(GTK_LABEL(protection_label_),
                               controller_->capture_protected()
                                   ? "Screen capture is blocked while this code is shown."
                                   : "Make sure nobody is recording your screen.");
            gtk_stack_set_visible_child_name(GTK_STACK(pages_), "transfer");
            break;
        }
        case transfer::SenderPhase::ERROR: {
            std::string text = "❌ " + controller_->error_message();
            gtk_label_set_text(GTK_LABEL(error_label_), text.c_str());
            gtk_stack_set_visible_child_name(GTK_STACK(pages_), "error");
            break;
        }
        case transfer::SenderPhase::CLOSED:
            gtk_label_set_text(GTK_LABEL(phrase_label_), "");
            gtk_picture_set_paintable(GTK_PICTURE(qr_picture_), nullptr);
            break;
    }
}

void SendPanel::on_frame(std::size_t index, const media::Image& image) {
    GdkTexture* texture = texture_from_image(image);
    gtk_picture_set_paintable(GTK_PICTURE(qr_picture_), GDK_PAINTABLE(texture));
    if (texture) g_object_unref(texture);

    std::string text = "QR " + std::to_string(index + 1) + " of " +
                       std::to_string(controller_->chunks().size()) + " · " +
                       std::to_string(controller_->total_entries()) + " entries";
    gtk_label_set_text(GTK_LABEL(frame_label_), text.c_str());
}

void SendPanel::update_entry_list() {
    GtkWidget* child;
    while ((child = gtk_widget_get_first_child(entry_list_box_)) != nullptr) {
        gtk_list_box_remove(GTK_LIST_BOX(entry_list_box_), child);
    }

    for (const auto& entry : controller_->entries()) {
        std::string display = entry.name;
        if (!entry.issuer.empty()) display += " (" + entry.issuer + ")";
        display += "  ·  ";
        display += vault::type_name(entry.type);
        if (vault::is_sensitive(entry.type)) display += " 🔒";

        GtkWidget* check = gtk_check_button_new_with_label(display.c_str());
        gtk_widget_add_css_class(check, "file-item");
        g_object_set_data_full(G_OBJECT(check), "entry-id", g_strdup(entry.id.c_str()), g_free);
        gtk_check_button_set_active(GTK_CHECK_BUTTON(check), controller_->is_selected(entry.id));
        g_signal_connect(check, "toggled", G_CALLBACK(on_entry_toggled), this);
        gtk_list_box_append(GTK_LIST_BOX(entry_list_box_), check);
    }

    if (controller_->entries().empty()) {
        GtkWidget* label = gtk_label_new("The vault is empty.");
        gtk_widget_add_css_class(label, "subtitle-text");
        gtk_list_box_append(GTK_LIST_BOX(entry_list_box_), label);
    }

    sync_selection();
}

void SendPanel::sync_selection() {
    // Rows are GtkListBoxRow wrappers around the check buttons
    for (GtkWidget* row = gtk_widget_get_first_child(entry_list_box_); row != nullptr;
         row = gtk_widget_get_next_sibling(row)) {
        GtkWidget* check = gtk_list_box_row_get_child(GTK_LIST_BOX_ROW(row));
        if (!GTK_IS_CHECK_BUTTON(check)) continue;
        auto* id = static_cast<const char*>(g_object_get_data(G_OBJECT(check), "entry-id"));
        bool selected = id && controller_->is_selected(id);
        if (gtk_check_button_get_active(GTK_CHECK_BUTTON(check)) != selected) {
            gtk_check_button_set_active(GTK_CHECK_BUTTON(check), selected);
        }
    }

    std::size_t count = controller_->selected().size();
    std::string text = std::to_string(count) + " selected";
    if (controller_->selection_requires_auth()) text += " · password required";
    gtk_label_set_text(GTK_LABEL(selection_label_), text.c_str());
    gtk_widget_set_sensitive(continue_button_, count > 0);
    gtk_button_set_label(GTK_BUTTON(select_all_button_),
                         count == controller_->entries().size() && count > 0 ? "Select None" : "Select All");
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void SendPanel::on_entry_toggled(GtkCheckButton* button, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    auto* id = static_cast<const char*>(g_object_get_data(G_OBJECT(button), "entry-id"));
    if (!id) return;

    // Ignore the echo of our own set_active calls
    bool active = gtk_check_button_get_active(button);
    if (active != self->controller_->is_selected(id)) {
        self->controller_->toggle(id);
    }
    self->sync_selection();
}

void SendPanel::on_select_all_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    self->controller_->toggle_all();
    self->sync_selection();
}

void SendPanel::on_continue_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    self->controller_->submit_selection();
}

void SendPanel::on_password_activate(GtkWidget* /*widget*/, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    std::string password = gtk_editable_get_text(GTK_EDITABLE(self->password_entry_));
    gtk_editable_set_text(GTK_EDITABLE(self->password_entry_), "");
    if (!self->controller_->submit_password(std::move(password))) {
        gtk_widget_grab_focus(self->password_entry_);
    }
}

void SendPanel::on_back_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    gtk_editable_set_text(GTK_EDITABLE(self->password_entry_), "");
    self->controller_->back();
}

void SendPanel::on_save_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<SendPanel*>(user_data)->save_transfer_file();
}

void SendPanel::save_transfer_file() {
    dismiss_file_dialog();

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* native = gtk_file_chooser_native_new(
        "Save Transfer File", parent_window_,
        GTK_FILE_CHOOSER_ACTION_SAVE, "_Save", "_Cancel");
    std::string suggested = std::string("vault") + protocol::TRANSFER_FILE_EXTENSION;
    gtk_file_chooser_set_current_name(GTK_FILE_CHOOSER(native), suggested.c_str());

    g_signal_connect(native, "response", G_CALLBACK(+[](GtkNativeDialog* dialog, int response, gpointer data) {
        auto* panel = static_cast<SendPanel*>(data);
        if (response == GTK_RESPONSE_ACCEPT) {
            GFile* file = gtk_file_chooser_get_file(GTK_FILE_CHOOSER(dialog));
            char* path = file ? g_file_get_path(file) : nullptr;
            if (path) {
                try {
                    panel->controller_->save_to_file(path);
                    gtk_label_set_text(GTK_LABEL(panel->protection_label_),
                                       "Transfer file saved. Share the phrase separately.");
                } catch (const std::exception& e) {
                    std::cerr << "SendPanel: " << e.what() << "\n";
                    std::string text = std::string("❌ ") + e.what();
                    gtk_label_set_text(GTK_LABEL(panel->protection_label_), text.c_str());
                }
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

void SendPanel::on_done_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    self->controller_->close();
    self->reset();
}

void SendPanel::on_retry_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<SendPanel*>(user_data);
    self->controller_->retry();
}

} // namespace ui
