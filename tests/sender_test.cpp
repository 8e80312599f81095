#include "sender.hpp"
#include "protocol/transfer_file.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace transfer;
using namespace testing_support;

namespace {

class SenderControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>();
        codec_ = std::make_shared<FakeQrCodec>();
        guard_ = std::make_shared<FakeCaptureGuard>();

        backend_->prepare_result.chunks = {"chunk-0", "chunk-1", "chunk-2"};
        backend_->prepare_result.verification_code = "alpha bravo charlie delta";
        backend_->prepare_result.total_entries = 1;

        SenderCallbacks callbacks;
        callbacks.on_phase = [this](SenderPhase phase) { phases_.push_back(phase); };
        callbacks.on_frame = [this](std::size_t index, const media::Image& image) {
            frames_.push_back(index);
            frame_texts_.emplace_back(image.pixels.begin(), image.pixels.end());
        };
        callbacks.on_error = [this](const std::string& message) { errors_.push_back(message); };

        controller_ = std::make_unique<SenderController>(backend_, codec_, guard_, loop_, callbacks);
        controller_->open(entries_);
    }

    void TearDown() override { controller_.reset(); }

    void prepare_totp() {
        ASSERT_TRUE(controller_->toggle("totp"));
        ASSERT_TRUE(controller_->submit_selection());
        loop_.drain();
    }

    std::vector<vault::EntrySummary> entries_ = {
        {"totp", vault::EntryType::TOTP, "GitHub", "github.com"},
        {"seed", vault::EntryType::SEED_PHRASE, "Wallet", ""},
        {"note", vault::EntryType::SECURE_NOTE, "Wifi", ""},
    };

    FakeEventLoop loop_;
    std::shared_ptr<FakeBackend> backend_;
    std::shared_ptr<FakeQrCodec> codec_;
    std::shared_ptr<FakeCaptureGuard> guard_;
    std::unique_ptr<SenderController> controller_;

    std::vector<SenderPhase> phases_;
    std::vector<std::size_t> frames_;
    std::vector<std::string> frame_texts_;
    std::vector<std::string> errors_;
};

} // namespace

TEST_F(SenderControllerTest, OpensInSelectWithNothingSelected) {
    EXPECT_EQ(controller_->phase(), SenderPhase::SELECT);
    EXPECT_TRUE(controller_->selected().empty());
    EXPECT_EQ(controller_->entries().size(), 3u);
    EXPECT_FALSE(controller_->submit_selection());
}

TEST_F(SenderControllerTest, ToggleAndToggleAll) {
    EXPECT_TRUE(controller_->toggle("note"));
    EXPECT_TRUE(controller_->is_selected("note"));
    EXPECT_TRUE(controller_->toggle("note"));
    EXPECT_FALSE(controller_->is_selected("note"));
    EXPECT_FALSE(controller_->toggle("unknown"));

    EXPECT_TRUE(controller_->toggle_all());
    EXPECT_EQ(controller_->selected().size(), 3u);
    EXPECT_TRUE(controller_->toggle_all());
    EXPECT_TRUE(controller_->selected().empty());
}

TEST_F(SenderControllerTest, SeedPhraseForcesAuth) {
    controller_->toggle("totp");
    controller_->toggle("seed");
    EXPECT_TRUE(controller_->selection_requires_auth());
    ASSERT_TRUE(controller_->submit_selection());

    EXPECT_EQ(controller_->phase(), SenderPhase::AUTH);
    EXPECT_EQ(loop_.background_count(), 0u);
    EXPECT_EQ(backend_->prepare_calls, 0);
}

TEST_F(SenderControllerTest, TotpOnlySkipsStraightToPreparing) {
    controller_->toggle("totp");
    ASSERT_TRUE(controller_->submit_selection());

    EXPECT_EQ(controller_->phase(), SenderPhase::PREPARING);
    EXPECT_EQ(loop_.background_count(), 1u);

    loop_.drain();
    EXPECT_EQ(backend_->prepare_calls, 1);
    EXPECT_EQ(backend_->last_ids, std::vector<std::string>{"totp"});
    EXPECT_FALSE(backend_->last_password.has_value());
    EXPECT_EQ(controller_->phase(), SenderPhase::TRANSFER);
}

TEST_F(SenderControllerTest, PasswordIsForwardedForSensitiveEntries) {
    controller_->toggle("seed");
    controller_->submit_selection();

    EXPECT_FALSE(controller_->submit_password(""));
    EXPECT_EQ(controller_->phase(), SenderPhase::AUTH);

    ASSERT_TRUE(controller_->submit_password("hunter2"));
    EXPECT_EQ(controller_->phase(), SenderPhase::PREPARING);
    loop_.drain();

    ASSERT_TRUE(backend_->last_password.has_value());
    EXPECT_EQ(*backend_->last_password, "hunter2");
    EXPECT_EQ(controller_->phase(), SenderPhase::TRANSFER);
}

TEST_F(SenderControllerTest, SessionRemembersSensitiveContentUntilClosed) {
    prepare_totp();
    EXPECT_FALSE(controller_->has_sensitive());
    controller_->close();

    backend_->prepare_result.has_sensitive = true;
    controller_->open(entries_);
    controller_->toggle("seed");
    controller_->submit_selection();
    ASSERT_TRUE(controller_->submit_password("hunter2"));
    loop_.drain();
    ASSERT_EQ(controller_->phase(), SenderPhase::TRANSFER);
    EXPECT_TRUE(controller_->has_sensitive());

    controller_->close();
    EXPECT_FALSE(controller_->has_sensitive());
}

TEST_F(SenderControllerTest, BackKeepsTheSelection) {
    controller_->toggle("seed");
    controller_->submit_selection();
    ASSERT_TRUE(controller_->back());
    EXPECT_EQ(controller_->phase(), SenderPhase::SELECT);
    EXPECT_TRUE(controller_->is_selected("seed"));
    EXPECT_FALSE(controller_->back());
}

TEST_F(SenderControllerTest, TransferShowsPhraseAndCyclesFrames) {
    prepare_totp();

    EXPECT_EQ(controller_->verification_code(), "alpha bravo charlie delta");
    EXPECT_EQ(controller_->chunks().size(), 3u);
    EXPECT_EQ(controller_->total_entries(), 1u);
    ASSERT_EQ(loop_.timer_count(), 1u);
    EXPECT_EQ(*loop_.only_timer_interval(), std::chrono::milliseconds(400));

    loop_.fire_timers();
    loop_.fire_timers();
    loop_.fire_timers();
    loop_.fire_timers();

    EXPECT_EQ(frames_, (std::vector<std::size_t>{0, 1, 2, 0, 1}));
    EXPECT_EQ(frame_texts_[2], "chunk-2");
    EXPECT_EQ(controller_->current_index(), 1u);
}

TEST_F(SenderControllerTest, SingleChunkDoesNotAnimate) {
    backend_->prepare_result.chunks = {"only"};
    prepare_totp();

    EXPECT_EQ(controller_->phase(), SenderPhase::TRANSFER);
    EXPECT_EQ(loop_.timer_count(), 0u);
    EXPECT_EQ(frames_, std::vector<std::size_t>{0});
}

TEST_F(SenderControllerTest, BackendErrorIsShownVerbatimAndRetryable) {
    backend_->prepare_error = "Incorrect password.";
    controller_->toggle("seed");
    controller_->submit_selection();
    controller_->submit_password("wrong");
    loop_.drain();

    EXPECT_EQ(controller_->phase(), SenderPhase::ERROR);
    EXPECT_EQ(controller_->error_message(), "Incorrect password.");
    EXPECT_EQ(errors_, std::vector<std::string>{"Incorrect password."});

    ASSERT_TRUE(controller_->retry());
    EXPECT_EQ(controller_->phase(), SenderPhase::SELECT);
    EXPECT_TRUE(controller_->chunks().empty());
    EXPECT_TRUE(controller_->error_message().empty());
}

TEST_F(SenderControllerTest, RenderFailureIsAnError) {
    codec_->fail_render = true;
    prepare_totp();

    EXPECT_EQ(controller_->phase(), SenderPhase::ERROR);
    EXPECT_EQ(controller_->error_message(), "data too large for a QR code");
    EXPECT_TRUE(controller_->verification_code().empty());
}

TEST_F(SenderControllerTest, CaptureProtectionIsReleasedOnClose) {
    prepare_totp();
    EXPECT_TRUE(controller_->capture_protected());
    EXPECT_EQ(guard_->calls, std::vector<bool>{true});

    controller_->close();
    EXPECT_EQ(controller_->phase(), SenderPhase::CLOSED);
    EXPECT_EQ(guard_->calls, (std::vector<bool>{true, false}));
    EXPECT_EQ(loop_.timer_count(), 0u);
    EXPECT_TRUE(controller_->verification_code().empty());
    EXPECT_TRUE(controller_->chunks().empty());
}

TEST_F(SenderControllerTest, UnsupportedCaptureProtectionIsNotLiftedLater) {
    guard_->supported = false;
    prepare_totp();
    EXPECT_FALSE(controller_->capture_protected());

    controller_->close();
    EXPECT_EQ(guard_->calls, std::vector<bool>{true});
}

TEST_F(SenderControllerTest, LateResultAfterCloseIsDropped) {
    controller_->toggle("totp");
    controller_->submit_selection();
    controller_->close();

    loop_.drain();
    EXPECT_EQ(backend_->prepare_calls, 1);
    EXPECT_EQ(controller_->phase(), SenderPhase::CLOSED);
    EXPECT_TRUE(controller_->chunks().empty());
    EXPECT_EQ(loop_.timer_count(), 0u);
    EXPECT_TRUE(guard_->calls.empty());
}

TEST_F(SenderControllerTest, LateResultAfterReopenIsDropped) {
    controller_->toggle("totp");
    controller_->submit_selection();
    controller_->close();
    controller_->open(entries_);

    loop_.drain();
    EXPECT_EQ(controller_->phase(), SenderPhase::SELECT);
    EXPECT_TRUE(controller_->chunks().empty());
}

TEST_F(SenderControllerTest, DestroyingWhilePreparingIsSafe) {
    backend_->prepare_error = "late failure";
    controller_->toggle("totp");
    controller_->submit_selection();
    controller_.reset();

    EXPECT_NO_THROW(loop_.drain());
    EXPECT_TRUE(errors_.empty());
}

TEST_F(SenderControllerTest, SaveToFileWritesChunksInOrder) {
    TempDir dir;
    std::string path = dir.file("out.vaultbeam-transfer");
    EXPECT_FALSE(controller_->save_to_file(path));

    prepare_totp();
    loop_.fire_timers();
    ASSERT_TRUE(controller_->save_to_file(path));

    EXPECT_EQ(protocol::load_transfer_file(path),
              (std::vector<std::string>{"chunk-0", "chunk-1", "chunk-2"}));
    EXPECT_EQ(controller_->current_index(), 1u);
}

TEST(SenderPhaseTest, Names) {
    EXPECT_STREQ(phase_name(SenderPhase::SELECT), "select");
    EXPECT_STREQ(phase_name(SenderPhase::TRANSFER), "transfer");
    EXPECT_STREQ(phase_name(SenderPhase::CLOSED), "closed");
}
