#include "ui/send_panel.hpp"
#include "ui/receive_panel.hpp"
#include "ui/gtk_event_loop.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace testing_support;

namespace {

// Panels need a display; headless runs skip
class PanelTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!gtk_init_check()) {
            GTEST_SKIP() << "no display available";
        }
        store_ = vault::EntryStore::load(dir_.file("vault.json"));
        store_->add({"", vault::EntryType::TOTP, "GitHub", "github.com", "JBSWY3DPEHPK3PXP"});
        backend_ = std::make_shared<FakeBackend>();
        codec_ = std::make_shared<FakeQrCodec>();
    }

    void drain() {
        while (g_main_context_iteration(nullptr, FALSE)) {
        }
    }

    TempDir dir_;
    std::shared_ptr<vault::EntryStore> store_;
    std::shared_ptr<FakeBackend> backend_;
    std::shared_ptr<FakeQrCodec> codec_;
};

} // namespace

TEST_F(PanelTest, DestroyingSendPanelDropsItsOpenFileDialog) {
    ui::GtkEventLoop loop;
    auto* panel = new ui::SendPanel(nullptr, store_, backend_, codec_,
                                    std::make_shared<FakeCaptureGuard>(), loop,
                                    std::chrono::milliseconds(400));
    panel->save_transfer_file();
    EXPECT_TRUE(panel->file_dialog_open());

    // Opening again replaces the dialog instead of stacking a second one
    panel->save_transfer_file();
    EXPECT_TRUE(panel->file_dialog_open());

    delete panel;
    drain();
}

TEST_F(PanelTest, DestroyingReceivePanelDropsItsOpenFileDialog) {
    ui::GtkEventLoop loop;
    auto* panel = new ui::ReceivePanel(nullptr, backend_, codec_, std::make_shared<FakeCamera>(),
                                       loop, std::chrono::milliseconds(100));
    panel->open_transfer_file();
    EXPECT_TRUE(panel->file_dialog_open());

    delete panel;
    drain();
}
