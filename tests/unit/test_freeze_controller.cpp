#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "ui/freeze_controller.hpp"
#include "ui/window_store.hpp"
#include "view_harness.hpp"

using namespace tessera;
using namespace tessera::ui;
using namespace std::chrono_literals;

namespace
{

class FreezeControllerTest : public ::testing::Test
{
   protected:
    void SetUp() override { window_ = open_window("https://www.are.na"); }

    WindowId open_window(const std::string& url)
    {
        WindowMeta meta;
        meta.type   = WindowType::Browser;
        meta.bounds = {0.0, 0.0, 640.0, 480.0};
        WindowId id = store_.add(meta);
        EXPECT_EQ(harness_.client().create_view(id, {0, 0, 640, 480}, url), ipc::ErrorCode::None);
        harness_.pump();
        store_.set_focused(id);
        return id;
    }

    void blur()
    {
        store_.clear_focus();
        freeze_->on_focus_changed(false);
    }

    void focus()
    {
        store_.set_focused(window_);
        freeze_->on_focus_changed(true);
    }

    FreezeState state() const { return freeze_->state(); }

    std::string pending_snapshot() const
    {
        const auto s = state();
        const auto* awaiting = std::get_if<FreezeAwaitingRender>(&s);
        return awaiting ? awaiting->snapshot.name : std::string();
    }

    test::ViewHarness                 harness_;
    WindowStore                       store_;
    WindowId                          window_ = INVALID_WINDOW_ID;
    std::unique_ptr<FreezeController> freeze_;

    void make_controller(WindowId id)
    {
        freeze_ = std::make_unique<FreezeController>(
            id, store_, harness_.client(), std::chrono::milliseconds(harness_.config().capture_timeout_ms));
    }

    void TearDown() override { freeze_.reset(); }
};

class FreezeFlowTest : public FreezeControllerTest
{
   protected:
    void SetUp() override
    {
        FreezeControllerTest::SetUp();
        make_controller(window_);
    }
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Normal flow
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(FreezeFlowTest, BlurCapturesThenFreezesAfterPaint)
{
    blur();
    EXPECT_TRUE(std::holds_alternative<FreezeCapturing>(state()));
    EXPECT_TRUE(freeze_->busy());
    EXPECT_EQ(freeze_->capture_count(), 1u);

    harness_.pump();
    std::string name = pending_snapshot();
    ASSERT_FALSE(name.empty());
    EXPECT_TRUE(harness_.blobs().read(name).has_value());
    EXPECT_FALSE(freeze_->busy());

    freeze_->on_snapshot_painted(name);
    EXPECT_TRUE(is_frozen(state()));
    EXPECT_EQ(snapshot_of(state())->name, name);
}

TEST_F(FreezeFlowTest, FocusActivatesOnce)
{
    blur();
    harness_.pump();
    freeze_->on_snapshot_painted(pending_snapshot());
    ASSERT_TRUE(is_frozen(state()));

    focus();
    EXPECT_TRUE(is_active(state()));
    EXPECT_EQ(freeze_->show_count(), 1u);
    harness_.pump();
    EXPECT_FALSE(freeze_->busy());
    EXPECT_EQ(freeze_->show_count(), 1u);

    // Already active: a second focus edge sends nothing.
    freeze_->on_focus_changed(true);
    EXPECT_EQ(freeze_->show_count(), 1u);
}

TEST_F(FreezeFlowTest, PaintOfOtherSnapshotIsIgnored)
{
    blur();
    harness_.pump();
    freeze_->on_snapshot_painted("/not-this-one");
    EXPECT_TRUE(std::holds_alternative<FreezeAwaitingRender>(state()));
}

TEST_F(FreezeFlowTest, PaintWhileActiveIsIgnored)
{
    freeze_->on_snapshot_painted("/whatever");
    EXPECT_TRUE(is_active(state()));
}

TEST_F(FreezeFlowTest, MinimizedWindowIsNotCaptured)
{
    store_.set_minimized(window_, true);
    freeze_->on_focus_changed(false);
    EXPECT_TRUE(is_active(state()));
    EXPECT_EQ(freeze_->capture_count(), 0u);
}

TEST_F(FreezeFlowTest, BlurWhileFrozenDoesNotRecapture)
{
    blur();
    harness_.pump();
    freeze_->on_snapshot_painted(pending_snapshot());
    freeze_->on_focus_changed(false);
    EXPECT_EQ(freeze_->capture_count(), 1u);
    EXPECT_TRUE(is_frozen(state()));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Races and failures
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(FreezeFlowTest, FocusDuringCaptureNeverFreezes)
{
    blur();
    focus();   // arrives while the capture is in flight
    EXPECT_TRUE(std::holds_alternative<FreezeCapturing>(state()));
    EXPECT_EQ(freeze_->show_count(), 0u);

    harness_.pump();
    EXPECT_TRUE(is_active(state()));
    EXPECT_EQ(freeze_->show_count(), 1u);
    EXPECT_FALSE(freeze_->busy());
}

TEST_F(FreezeFlowTest, BlurAgainDuringShowCapturesAfterwards)
{
    blur();
    harness_.pump();
    freeze_->on_snapshot_painted(pending_snapshot());
    focus();
    blur();   // dropped while showAndFocus is pending
    EXPECT_EQ(freeze_->capture_count(), 1u);

    harness_.pump();
    EXPECT_EQ(freeze_->capture_count(), 2u);
    EXPECT_FALSE(pending_snapshot().empty());
}

TEST_F(FreezeFlowTest, FailedCaptureStaysLive)
{
    harness_.surface(window_)->set_capture_mode(view::HeadlessSurface::CaptureMode::Fail);
    blur();
    harness_.pump();
    EXPECT_TRUE(is_active(state()));
    EXPECT_FALSE(freeze_->busy());

    // No retry until the next focus edge.
    harness_.pump();
    EXPECT_EQ(freeze_->capture_count(), 1u);
}

TEST_F(FreezeFlowTest, CaptureTimesOut)
{
    harness_.surface(window_)->set_capture_mode(view::HeadlessSurface::CaptureMode::Deferred);
    blur();
    harness_.pump();
    ASSERT_TRUE(std::holds_alternative<FreezeCapturing>(state()));

    auto t0 = FreezeController::Clock::now();
    freeze_->tick(t0);
    freeze_->tick(t0 + 999ms);
    EXPECT_TRUE(std::holds_alternative<FreezeCapturing>(state()));
    freeze_->tick(t0 + 1000ms);
    EXPECT_TRUE(is_active(state()));
    EXPECT_FALSE(freeze_->busy());

    // The late snapshot is discarded.
    ASSERT_TRUE(harness_.surface(window_)->complete_capture(true));
    harness_.pump();
    EXPECT_TRUE(is_active(state()));
}

TEST_F(FreezeControllerTest, SignInPageIsNeverFrozen)
{
    WindowId auth = open_window("https://accounts.google.com/signin");
    make_controller(auth);
    store_.clear_focus();
    freeze_->on_focus_changed(false);
    harness_.pump();
    EXPECT_TRUE(is_active(freeze_->state()));
    EXPECT_EQ(harness_.blobs().active_count(), 0u);
}

TEST_F(FreezeControllerTest, ReplyAfterDestructionIsIgnored)
{
    make_controller(window_);
    store_.clear_focus();
    freeze_->on_focus_changed(false);
    freeze_.reset();
    harness_.pump();
    EXPECT_TRUE(std::holds_alternative<FreezeCapturing>(store_.find(window_)->browser->freeze));
}

TEST_F(FreezeFlowTest, DisconnectedCaptureStaysLive)
{
    harness_.ui_port().close();
    harness_.client().poll();
    blur();
    EXPECT_TRUE(is_active(state()));
    EXPECT_FALSE(freeze_->busy());
}
