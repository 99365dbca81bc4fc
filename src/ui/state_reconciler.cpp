#include "state_reconciler.hpp"

#include <tessera/logger.hpp>

#include "../core/url.hpp"
#include "window_store.hpp"

namespace tessera::ui
{

StateReconciler::StateReconciler(WindowStore& store, ViewClient& client)
    : store_(store), client_(client)
{
}

ipc::ErrorCode StateReconciler::load_url(WindowId           window_id,
                                         const std::string& input,
                                         ReplyHandler       done)
{
    auto url = normalize_url(input);
    if (!url)
        return ipc::ErrorCode::InvalidUrl;

    const auto* w = store_.find(window_id);
    if (!w || !w->browser)
        return ipc::ErrorCode::UnknownWindow;

    NavSeq seq    = next_seq_;
    TabId  tab_id = w->browser->state.active_tab_id;

    auto err = client_.load_url(
        window_id, *url, seq,
        [this, window_id, seq, done = std::move(done)](const Reply& reply)
        {
            if (!reply.ok())
            {
                TESSERA_LOG_WARN("reconcile", "loadUrl for window {} failed: {}", window_id,
                                 reply.message);
                store_.update_browser(window_id,
                                      [&](BrowserPayload& b)
                                      {
                                          if (!b.inflight || b.inflight->seq != seq)
                                              return;
                                          if (auto* tab = b.state.find_tab(b.inflight->tab_id))
                                          {
                                              tab->is_loading = false;
                                              tab->error      = reply.message;
                                          }
                                          b.inflight.reset();
                                      });
            }
            if (done)
                done(reply);
        });
    if (err != ipc::ErrorCode::None)
        return err;

    ++next_seq_;
    if (tab_id == INVALID_TAB_ID)
        return ipc::ErrorCode::None;

    store_.update_browser(window_id,
                          [&](BrowserPayload& b)
                          {
                              if (auto* tab = b.state.find_tab(tab_id))
                              {
                                  tab->url        = *url;
                                  tab->is_loading = true;
                                  tab->error.reset();
                              }
                              b.inflight = InflightNavigation{tab_id, seq, *url};
                          });
    TESSERA_LOG_DEBUG("reconcile", "Window {} tab {} loading {} (seq {})", window_id, tab_id, *url,
                      seq);
    return ipc::ErrorCode::None;
}

ipc::ErrorCode StateReconciler::navigate(WindowId window_id, NavigationAction action, ReplyHandler done)
{
    auto err = client_.navigate(window_id, action, std::move(done));
    if (err != ipc::ErrorCode::None)
        return err;

    store_.update_browser(window_id, [](BrowserPayload& b) { b.inflight.reset(); });
    return ipc::ErrorCode::None;
}

// ─── View process events ─────────────────────────────────────────────────────

void StateReconciler::apply_state(WindowId window_id, const BrowserState& incoming)
{
    const auto* w = store_.find(window_id);
    if (!w || !w->browser)
    {
        TESSERA_LOG_DEBUG("reconcile", "State for unknown window {}", window_id);
        return;
    }
    if (incoming.tabs.empty() || !incoming.active_tab())
    {
        TESSERA_LOG_WARN("reconcile", "Ignoring state for window {} without an active tab",
                         window_id);
        return;
    }

    std::string title;
    store_.update_browser(
        window_id,
        [&](BrowserPayload& b)
        {
            BrowserState merged = incoming;
            if (b.inflight)
            {
                const InflightNavigation& req = *b.inflight;
                TabState*                 tab = merged.find_tab(req.tab_id);
                if (!tab)
                {
                    b.inflight.reset();
                }
                else if (tab->nav_seq >= req.seq || tab->url == req.requested_url)
                {
                    if (tab->url != req.requested_url)
                        TESSERA_LOG_DEBUG("reconcile", "Window {} request for {} superseded by {}",
                                          window_id, req.requested_url, tab->url);
                    b.inflight.reset();
                }
                else
                {
                    TESSERA_LOG_DEBUG("reconcile",
                                      "Window {} keeping {} over stale {} (seq {} < {})",
                                      window_id, req.requested_url, tab->url, tab->nav_seq, req.seq);
                    tab->url        = req.requested_url;
                    tab->is_loading = true;
                    tab->error.reset();
                }
            }
            b.state = std::move(merged);
            title   = b.state.active_tab()->title;
        });

    store_.set_title(window_id, title);
}

void StateReconciler::on_surface_crashed(WindowId window_id, TabId tab_id)
{
    TESSERA_LOG_WARN("reconcile", "Surface of window {} tab {} crashed", window_id, tab_id);
    store_.update_browser(window_id,
                          [tab_id](BrowserPayload& b)
                          {
                              if (b.inflight && b.inflight->tab_id == tab_id)
                                  b.inflight.reset();
                          });
}

void StateReconciler::on_window_closed(WindowId window_id)
{
    if (store_.remove(window_id))
        TESSERA_LOG_INFO("reconcile", "Window {} closed by the view process", window_id);
}

}   // namespace tessera::ui
