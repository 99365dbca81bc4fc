#pragma once

#include <string>
#include <tessera/fwd.hpp>
#include <tessera/tab_state.hpp>

#include "../ipc/message.hpp"
#include "view_client.hpp"

namespace tessera::ui
{

class WindowStore;

/**
 * StateReconciler — merges the view process's authoritative tab state
 * into the WindowStore without losing optimistic address-bar writes.
 *
 * load_url() writes the normalized URL and isLoading into the active
 * tab at once, and records the request as in flight with a fresh
 * navigation sequence number.  An incoming state-changed event for that
 * tab is accepted when its sequence number has caught up with the
 * request, or when it already shows the requested URL.  Anything older
 * is a late report about a superseded navigation: the rest of the event
 * is applied but the tab keeps the optimistic URL and loading flag.
 * Once accepted, the in-flight request is dropped, silently, even if the
 * page ended up somewhere else.
 */
class StateReconciler
{
   public:
    StateReconciler(WindowStore& store, ViewClient& client);

    StateReconciler(const StateReconciler&)            = delete;
    StateReconciler& operator=(const StateReconciler&) = delete;

    // Address-bar input.  Returns InvalidUrl for blank input without
    // touching the store.  `done` sees the view process's answer.
    ipc::ErrorCode load_url(WindowId window_id, const std::string& input, ReplyHandler done = nullptr);

    // Back/forward/reload/stop.  Abandons any in-flight load.
    ipc::ErrorCode navigate(WindowId window_id, NavigationAction action, ReplyHandler done = nullptr);

    // ─── View process events ─────────────────────────────────────────────

    void apply_state(WindowId window_id, const BrowserState& incoming);
    void on_surface_crashed(WindowId window_id, TabId tab_id);
    void on_window_closed(WindowId window_id);

    NavSeq last_nav_seq() const { return next_seq_ - 1; }

   private:
    WindowStore& store_;
    ViewClient&  client_;
    NavSeq       next_seq_ = 1;
};

}   // namespace tessera::ui
