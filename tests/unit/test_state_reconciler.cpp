#include <gtest/gtest.h>

#include <optional>

#include "ui/state_reconciler.hpp"
#include "ui/window_store.hpp"
#include "view_harness.hpp"

using namespace tessera;
using namespace tessera::ui;
using tessera::ipc::ErrorCode;

namespace
{

class StateReconcilerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        harness_.client().set_state_handler([this](WindowId w, const BrowserState& s)
                                            { reconciler_.apply_state(w, s); });
        WindowMeta meta;
        meta.type   = WindowType::Browser;
        meta.bounds = {0.0, 0.0, 800.0, 600.0};
        window_     = store_.add(meta);
        ASSERT_EQ(harness_.client().create_view(window_, {0, 0, 800, 600}, "https://www.are.na"),
                  ErrorCode::None);
        harness_.pump();
    }

    const BrowserPayload& payload() { return *store_.find(window_)->browser; }
    const TabState&       active() { return *payload().state.active_tab(); }

    test::ViewHarness harness_;
    WindowStore       store_;
    StateReconciler   reconciler_{store_, harness_.client()};
    WindowId          window_ = INVALID_WINDOW_ID;
};

}   // namespace

TEST_F(StateReconcilerTest, ViewStateFlowsIntoStore)
{
    EXPECT_EQ(active().url, "https://www.are.na");
    EXPECT_FALSE(active().is_loading);
    EXPECT_EQ(active().title, "www.are.na");
    EXPECT_EQ(store_.find(window_)->title, "www.are.na");
}

TEST_F(StateReconcilerTest, LoadUrlIsOptimistic)
{
    ASSERT_EQ(reconciler_.load_url(window_, "example.com"), ErrorCode::None);

    EXPECT_EQ(active().url, "https://example.com");
    EXPECT_TRUE(active().is_loading);
    ASSERT_TRUE(payload().inflight.has_value());
    EXPECT_EQ(payload().inflight->requested_url, "https://example.com");
    EXPECT_EQ(payload().inflight->seq, reconciler_.last_nav_seq());

    harness_.pump();
    EXPECT_EQ(active().url, "https://example.com");
    EXPECT_FALSE(active().is_loading);
    EXPECT_FALSE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, StaleReportDoesNotClobberAddressBar)
{
    ASSERT_EQ(reconciler_.load_url(window_, "https://new.example"), ErrorCode::None);

    // A report about the previous page, sent before the view saw the load.
    BrowserState stale = payload().state;
    TabState*    tab   = stale.find_tab(stale.active_tab_id);
    tab->url           = "https://www.are.na/";
    tab->is_loading    = false;
    tab->title         = "Old";
    tab->nav_seq       = 0;
    reconciler_.apply_state(window_, stale);

    EXPECT_EQ(active().url, "https://new.example");
    EXPECT_TRUE(active().is_loading);
    EXPECT_EQ(active().title, "Old");
    EXPECT_TRUE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, NewerSequenceIsAccepted)
{
    reconciler_.load_url(window_, "https://first.example");
    NavSeq seq = reconciler_.last_nav_seq();

    BrowserState incoming = payload().state;
    TabState*    tab      = incoming.find_tab(incoming.active_tab_id);
    tab->url              = "https://first.example/redirected";
    tab->is_loading       = false;
    tab->nav_seq          = seq;
    reconciler_.apply_state(window_, incoming);

    EXPECT_EQ(active().url, "https://first.example/redirected");
    EXPECT_FALSE(active().is_loading);
    EXPECT_FALSE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, MatchingUrlIsAcceptedWithoutSequence)
{
    reconciler_.load_url(window_, "https://first.example");

    BrowserState incoming = payload().state;
    TabState*    tab      = incoming.find_tab(incoming.active_tab_id);
    tab->url              = "https://first.example";
    tab->nav_seq          = 0;
    reconciler_.apply_state(window_, incoming);
    EXPECT_FALSE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, RapidLoadsEndOnTheLastOne)
{
    reconciler_.load_url(window_, "https://one.example");
    reconciler_.load_url(window_, "https://two.example");
    reconciler_.load_url(window_, "https://three.example");
    EXPECT_EQ(active().url, "https://three.example");

    harness_.pump();
    EXPECT_EQ(active().url, "https://three.example");
    EXPECT_FALSE(active().is_loading);
    EXPECT_FALSE(active().error.has_value());
}

TEST_F(StateReconcilerTest, BlankInputTouchesNothing)
{
    BrowserState before = payload().state;
    EXPECT_EQ(reconciler_.load_url(window_, "   "), ErrorCode::InvalidUrl);
    EXPECT_EQ(payload().state, before);
    EXPECT_FALSE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, UnknownWindow)
{
    EXPECT_EQ(reconciler_.load_url(999, "https://a"), ErrorCode::UnknownWindow);
}

TEST_F(StateReconcilerTest, RejectedLoadMarksTab)
{
    // A store window the view process never heard of.
    WindowMeta meta;
    meta.type      = WindowType::Browser;
    WindowId ghost = store_.add(meta);
    store_.update_browser(ghost,
                          [](BrowserPayload& b)
                          {
                              TabState t;
                              t.id = 77;
                              b.state.tabs.push_back(t);
                              b.state.active_tab_id = 77;
                          });

    std::optional<ErrorCode> result;
    ASSERT_EQ(reconciler_.load_url(ghost, "https://a", [&](const Reply& r) { result = r.error; }),
              ErrorCode::None);
    harness_.pump();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, ErrorCode::UnknownWindow);
    const TabState& tab = *store_.find(ghost)->browser->state.active_tab();
    EXPECT_FALSE(tab.is_loading);
    EXPECT_TRUE(tab.error.has_value());
    EXPECT_FALSE(store_.find(ghost)->browser->inflight.has_value());
}

TEST_F(StateReconcilerTest, NavigateAbandonsInflightLoad)
{
    reconciler_.load_url(window_, "https://a.example");
    ASSERT_EQ(reconciler_.navigate(window_, NavigationAction::Stop), ErrorCode::None);
    EXPECT_FALSE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, CrashAbandonsInflightLoad)
{
    reconciler_.load_url(window_, "https://a.example");
    reconciler_.on_surface_crashed(window_, active().id);
    EXPECT_FALSE(payload().inflight.has_value());
}

TEST_F(StateReconcilerTest, StateWithoutActiveTabIsIgnored)
{
    BrowserState before = payload().state;
    BrowserState empty;
    reconciler_.apply_state(window_, empty);
    EXPECT_EQ(payload().state, before);
}

TEST_F(StateReconcilerTest, StateForUnknownWindowIsIgnored)
{
    BrowserState s = payload().state;
    reconciler_.apply_state(4242, s);
    EXPECT_EQ(store_.count(), 1u);
}

TEST_F(StateReconcilerTest, WindowClosedRemovesIt)
{
    reconciler_.on_window_closed(window_);
    EXPECT_EQ(store_.find(window_), nullptr);
    reconciler_.on_window_closed(window_);
}

TEST_F(StateReconcilerTest, ViewClosingLastTabRemovesWindow)
{
    harness_.client().set_window_closed_handler([this](WindowId w)
                                                { reconciler_.on_window_closed(w); });
    ASSERT_EQ(harness_.client().close_tab(window_, active().id), ErrorCode::None);
    harness_.pump();
    EXPECT_EQ(store_.find(window_), nullptr);
}
