#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "ui/bounds_synchronizer.hpp"
#include "ui/window_store.hpp"
#include "view_harness.hpp"

using namespace tessera;
using namespace tessera::ui;

namespace
{

WindowMeta browser_window(WindowId id, const RectF& bounds, size_t tabs = 1)
{
    WindowMeta w;
    w.id     = id;
    w.type   = WindowType::Browser;
    w.bounds = bounds;
    w.browser.emplace();
    for (size_t i = 0; i < tabs; ++i)
    {
        TabState tab;
        tab.id  = static_cast<TabId>(i + 1);
        tab.url = "https://www.are.na";
        w.browser->state.tabs.push_back(tab);
    }
    return w;
}

class BoundsSynchronizerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        ASSERT_EQ(harness_.client().create_view(1, {0, 0, 100, 100}, "https://www.are.na"),
                  ipc::ErrorCode::None);
        harness_.pump();
    }

    Rect surface_bounds() { return harness_.surface(1)->bounds(); }

    test::ViewHarness  harness_;
    BoundsSynchronizer sync_{harness_.client()};
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Content rect
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ContentRect, SingleTabHasNoTabBar)
{
    auto r = BoundsSynchronizer::content_rect(browser_window(1, {100, 50, 800, 600}), ChromeInsets{});
    EXPECT_DOUBLE_EQ(r.x, 104.0);
    EXPECT_DOUBLE_EQ(r.y, 128.0);
    EXPECT_DOUBLE_EQ(r.width, 792.0);
    EXPECT_DOUBLE_EQ(r.height, 518.0);
}

TEST(ContentRect, SeveralTabsShiftBelowTabBar)
{
    auto r = BoundsSynchronizer::content_rect(browser_window(1, {100, 50, 800, 600}, 2), ChromeInsets{});
    EXPECT_DOUBLE_EQ(r.x, 104.0);
    EXPECT_DOUBLE_EQ(r.y, 160.0);
    EXPECT_DOUBLE_EQ(r.width, 792.0);
    EXPECT_DOUBLE_EQ(r.height, 486.0);
}

TEST(ContentRect, SidebarAndPadding)
{
    ChromeInsets insets;
    insets.sidebar = 240.0;
    insets.padding = 8.0;
    auto r = BoundsSynchronizer::content_rect(browser_window(1, {0, 0, 800, 600}), insets);
    EXPECT_DOUBLE_EQ(r.x, 252.0);
    EXPECT_DOUBLE_EQ(r.y, 78.0);
    EXPECT_DOUBLE_EQ(r.width, 776.0);
    EXPECT_DOUBLE_EQ(r.height, 510.0);
}

TEST(ContentRect, TinyWindowClampsToZero)
{
    auto r = BoundsSynchronizer::content_rect(browser_window(1, {10, 10, 5, 20}, 3), ChromeInsets{});
    EXPECT_DOUBLE_EQ(r.width, 0.0);
    EXPECT_DOUBLE_EQ(r.height, 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Geometry
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BoundsSynchronizerTest, UpdatesAreCoalescedPerFrame)
{
    sync_.update_geometry(1, {0, 0, 200, 200});
    sync_.update_geometry(1, {0, 0, 300, 300});
    sync_.update_geometry(1, {10.5, 20.25, 399.5, 400});
    EXPECT_EQ(sync_.pending_count(), 1u);

    EXPECT_EQ(sync_.on_frame(), 1u);
    EXPECT_EQ(sync_.pending_count(), 0u);
    harness_.pump();
    EXPECT_EQ(surface_bounds(), (Rect{10, 20, 400, 400}));
    EXPECT_EQ(sync_.last_sent(1), (Rect{10, 20, 400, 400}));
}

TEST_F(BoundsSynchronizerTest, UnchangedRectIsNotResent)
{
    sync_.update_geometry(1, {0, 0, 320, 240});
    EXPECT_EQ(sync_.on_frame(), 1u);
    sync_.update_geometry(1, {0, 0, 320, 240});
    EXPECT_EQ(sync_.on_frame(), 0u);
    EXPECT_EQ(sync_.on_frame(), 0u);
}

TEST_F(BoundsSynchronizerTest, UpdateWindowUsesContentRect)
{
    sync_.update_window(browser_window(1, {100, 50, 800, 600}));
    sync_.on_frame();
    harness_.pump();
    EXPECT_EQ(surface_bounds(), (Rect{104, 128, 792, 518}));
}

TEST_F(BoundsSynchronizerTest, PanelsAreIgnored)
{
    WindowMeta panel;
    panel.id     = 2;
    panel.type   = WindowType::Notes;
    panel.bounds = {0, 0, 300, 300};
    sync_.update_window(panel);
    EXPECT_EQ(sync_.pending_count(), 0u);
}

TEST_F(BoundsSynchronizerTest, InvalidRectsAreDropped)
{
    sync_.update_geometry(1, {0, 0, -1, 10});
    sync_.update_geometry(2, {std::numeric_limits<double>::quiet_NaN(), 0, 10, 10});
    sync_.update_geometry(3, {0, 0, std::numeric_limits<double>::infinity(), 10});
    EXPECT_EQ(sync_.pending_count(), 0u);
    EXPECT_EQ(sync_.on_frame(), 0u);
}

TEST_F(BoundsSynchronizerTest, NegativeOriginIsAllowed)
{
    sync_.update_geometry(1, {-30, -12, 200, 100});
    EXPECT_EQ(sync_.on_frame(), 1u);
    harness_.pump();
    EXPECT_EQ(surface_bounds(), (Rect{-30, -12, 200, 100}));
}

TEST_F(BoundsSynchronizerTest, ForgetResendsSameRect)
{
    sync_.update_geometry(1, {0, 0, 320, 240});
    sync_.on_frame();
    sync_.forget(1);
    EXPECT_FALSE(sync_.last_sent(1).has_value());
    sync_.update_geometry(1, {0, 0, 320, 240});
    EXPECT_EQ(sync_.on_frame(), 1u);
}

TEST_F(BoundsSynchronizerTest, NothingSentWhenDisconnected)
{
    harness_.ui_port().close();
    sync_.update_geometry(1, {0, 0, 320, 240});
    EXPECT_EQ(sync_.on_frame(), 0u);
    EXPECT_FALSE(sync_.last_sent(1).has_value());
}

TEST_F(BoundsSynchronizerTest, VisibilityIsSentImmediately)
{
    sync_.push_visibility(1, false, false);
    harness_.pump();
    EXPECT_FALSE(harness_.surface(1)->is_visible());
    sync_.push_visibility(1, true, true);
    harness_.pump();
    EXPECT_TRUE(harness_.surface(1)->is_visible());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Stacking
// ═══════════════════════════════════════════════════════════════════════════════

TEST(StackingOrder, AscendingZWithStableTies)
{
    WindowStore store;
    WindowId    a = store.add(browser_window(0, {0, 0, 100, 100}));
    WindowId    b = store.add(browser_window(0, {0, 0, 100, 100}));
    WindowMeta  notes;
    notes.type = WindowType::Notes;
    store.add(notes);
    WindowId c = store.add(browser_window(0, {0, 0, 100, 100}));

    store.find(a)->z_index = 5;
    store.find(b)->z_index = 1;
    store.find(c)->z_index = 5;

    auto order = BoundsSynchronizer::stacking_order(store);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0].window_id, b);
    EXPECT_EQ(order[1].window_id, a);
    EXPECT_EQ(order[2].window_id, c);
}

TEST(StackingOrder, CarriesFrozenAndMinimizedFlags)
{
    WindowStore store;
    WindowId    a = store.add(browser_window(0, {0, 0, 100, 100}));
    WindowId    b = store.add(browser_window(0, {0, 0, 100, 100}));
    store.set_freeze_state(a, FreezeFrozen{ImageRef{"/snap-1", 4, 3}});
    store.set_minimized(b, true);

    auto order = BoundsSynchronizer::stacking_order(store);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_TRUE(order[0].is_frozen);
    EXPECT_FALSE(order[0].is_minimized);
    EXPECT_FALSE(order[1].is_frozen);
    EXPECT_TRUE(order[1].is_minimized);
}

TEST_F(BoundsSynchronizerTest, StackingSentOnlyOnChange)
{
    WindowStore store;
    WindowId    a = store.add(browser_window(0, {0, 0, 100, 100}));
    store.add(browser_window(0, {0, 0, 100, 100}));

    EXPECT_TRUE(sync_.sync_stacking(store));
    EXPECT_FALSE(sync_.sync_stacking(store));

    store.set_focused(a);   // raises a
    EXPECT_TRUE(sync_.sync_stacking(store));
    EXPECT_FALSE(sync_.sync_stacking(store));

    sync_.invalidate_stacking();
    EXPECT_TRUE(sync_.sync_stacking(store));
}

TEST_F(BoundsSynchronizerTest, StackingNotRecordedWhenDisconnected)
{
    WindowStore store;
    store.add(browser_window(0, {0, 0, 100, 100}));
    harness_.ui_port().close();
    EXPECT_FALSE(sync_.sync_stacking(store));
}
