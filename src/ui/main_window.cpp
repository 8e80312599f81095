#include "ui/main_window.hpp"
#include "ui/send_panel.hpp"
#include "ui/receive_panel.hpp"
#include <iostream>

namespace ui {

static const char* CSS_STYLE = R"(
window {
    background-color: #1a1a2e;
}

headerbar {
    background: linear-gradient(to right, #16213e, #0f3460);
    color: #e0e0e0;
    border-bottom: 1px solid #533483;
}

headerbar title {
    color: #e0e0e0;
    font-weight: bold;
}

stackswitcher button {
    color: #a0a0c0;
    background: transparent;
    border: none;
    border-radius: 8px;
    padding: 6px 16px;
    margin: 4px;
}

stackswitcher button:checked {
    background-color: #533483;
    color: white;
}

stackswitcher button:hover:not(:checked) {
    background-color: rgba(83, 52, 131, 0.3);
}

.pin-display {
    font-size: 24px;
    font-weight: bold;
    color: #e94560;
    letter-spacing: 2px;
    padding: 16px;
}

.qr-frame {
    background-color: white;
    border-radius: 12px;
    padding: 12px;
}

.status-text {
    color: #a0a0b0;
    font-size: 14px;
}

.title-text {
    color: #e0e0e0;
    font-size: 18px;
    font-weight: bold;
}

.subtitle-text {
    color: #808090;
    font-size: 13px;
}

.file-item {
    min-height: 28px;
    background-color: #16213e;
    border-radius: 8px;
    padding: 8px 12px;
    margin: 2px 8px;
    color: #c0c0d0;
}

label {
    color: #c0c0d0;
}

button.suggested-action {
    background-color: #533483;
    color: white;
    border-radius: 10px;
    padding: 8px 20px;
    border: none;
    font-weight: bold;
}

button.suggested-action:hover {
    background-color: #6a42a0;
}

button.destructive-action {
    background-color: #e94560;
    color: white;
    border-radius: 10px;
    padding: 8px 20px;
    border: none;
}

button.destructive-action:hover {
    background-color: #ff5a75;
}

button.flat {
    color: #a0a0c0;
    background: transparent;
    border: none;
}

button.flat:hover {
    background-color: rgba(83, 52, 131, 0.3);
}

progressbar trough {
    background-color: #16213e;
    border-radius: 6px;
    min-height: 10px;
}

progressbar progress {
    background: linear-gradient(to right, #533483, #e94560);
    border-radius: 6px;
    min-height: 10px;
}

scrolledwindow {
    background-color: transparent;
}

entry {
    background-color: #16213e;
    color: #e0e0e0;
    border: 1px solid #533483;
    border-radius: 8px;
    padding: 8px 12px;
}

entry:focus {
    border-color: #e94560;
}

.section-box {
    background-color: rgba(15, 52, 96, 0.3);
    border-radius: 12px;
    padding: 16px;
    margin: 8px;
}
)";

void MainWindow::setup_css() {
    GtkCssProvider* provider = gtk_css_provider_new();
    gtk_css_provider_load_from_string(provider, CSS_STYLE);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(),
        GTK_STYLE_PROVIDER(provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
    g_object_unref(provider);
}

void MainWindow::on_destroy(GtkWidget* /*widget*/, gpointer data) {
    auto* self = static_cast<MainWindow*>(data);
    g_signal_handlers_disconnect_by_data(self->stack_, self);
    // Stops the camera, the QR animation and any capture protection
    delete self;
}

void MainWindow::on_page_changed(GObject* stack, GParamSpec* /*pspec*/, gpointer data) {
    auto* self = static_cast<MainWindow*>(data);
    const char* name = gtk_stack_get_visible_child_name(GTK_STACK(stack));
    if (!name) return;

    // Leaving a tab ends its session so no QR code or camera outlives the view
    if (std::string(name) == "send") {
        self->receive_panel_->close();
        self->send_panel_->reset();
    } else {
        self->send_panel_->close();
        self->receive_panel_->reset();
    }
}

MainWindow::MainWindow(GtkApplication* app, const config::Config& cfg) {
    setup_css();

    store_ = vault::EntryStore::load(cfg.vault_path);
    backend_ = std::make_shared<transfer::VaultBackend>(store_, cfg.max_chunk_size);
    codec_ = std::make_shared<media::ZbarQrCodec>(cfg.qr_scale, cfg.qr_margin);
    auto camera = std::make_shared<media::V4l2Camera>(cfg.camera_device, cfg.camera_width, cfg.camera_height);
    auto guard = std::make_shared<transfer::NoCaptureGuard>();

    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), "VaultBeam");
    gtk_window_set_default_size(GTK_WINDOW(window_), 520, 720);

    // Header bar
    header_bar_ = gtk_header_bar_new();
    gtk_window_set_titlebar(GTK_WINDOW(window_), header_bar_);

    // Stack
    stack_ = gtk_stack_new();
    gtk_stack_set_transition_type(GTK_STACK(stack_), GTK_STACK_TRANSITION_TYPE_SLIDE_LEFT_RIGHT);
    gtk_stack_set_transition_duration(GTK_STACK(stack_), 300);

    send_panel_ = new SendPanel(GTK_WINDOW(window_), store_, backend_, codec_, guard, loop_,
                                std::chrono::milliseconds(cfg.frame_interval_ms));
    receive_panel_ = new ReceivePanel(GTK_WINDOW(window_), backend_, codec_, camera, loop_,
                                      std::chrono::milliseconds(cfg.scan_interval_ms));

    gtk_stack_add_titled(GTK_STACK(stack_), send_panel_->get_widget(), "send", "Send");
    gtk_stack_add_titled(GTK_STACK(stack_), receive_panel_->get_widget(), "receive", "Receive");

    // Stack switcher in header
    GtkWidget* switcher = gtk_stack_switcher_new();
    gtk_stack_switcher_set_stack(GTK_STACK_SWITCHER(switcher), GTK_STACK(stack_));
    gtk_header_bar_set_title_widget(GTK_HEADER_BAR(header_bar_), switcher);

    gtk_window_set_child(GTK_WINDOW(window_), stack_);

    g_signal_connect(stack_, "notify::visible-child", G_CALLBACK(on_page_changed), this);
    g_signal_connect(window_, "destroy", G_CALLBACK(on_destroy), this);

    std::cout << "Vault: " << cfg.vault_path << " (" << store_->size() << " entries)\n";
    gtk_window_present(GTK_WINDOW(window_));
}

MainWindow::~MainWindow() {
    // Panels hold controllers that use loop_, so they go first
    delete send_panel_;
    delete receive_panel_;
}

static void activate_callback(GtkApplication* app, gpointer user_data) {
    auto* cfg = static_cast<const config::Config*>(user_data);
    try {
        // Deleted from its own "destroy" handler
        new MainWindow(app, *cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        g_application_quit(G_APPLICATION(app));
    }
}

int run_gui(const config::Config& cfg) {
    GtkApplication* app = gtk_application_new("dev.vaultbeam.app", G_APPLICATION_DEFAULT_FLAGS);
    g_signal_connect(app, "activate", G_CALLBACK(activate_callback), const_cast<config::Config*>(&cfg));
    int status = g_application_run(G_APPLICATION(app), 0, nullptr);
    g_object_unref(app);
    return status;
}

} // namespace ui
