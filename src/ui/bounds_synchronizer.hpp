#pragma once

#include <map>
#include <optional>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>
#include <vector>

#include "../ipc/message.hpp"

namespace tessera::ui
{

class ViewClient;
class WindowStore;
struct WindowMeta;

// Chrome around a browser window's live surface, in layout pixels.
struct ChromeInsets
{
    double sidebar   = 0.0;    // workspace sidebar left of every window
    double title_bar = 40.0;   // window frame title bar
    double border    = 4.0;    // visible frame border
    double toolbar   = 38.0;   // address bar and navigation buttons
    double tab_bar   = 32.0;   // only shown with more than one tab
    double padding   = 0.0;    // extra inset inside the content area
};

/**
 * BoundsSynchronizer — keeps surface geometry, visibility and stacking
 * in step with the UI layout.
 *
 * Geometry updates are coalesced: within one frame only the last rect
 * per window survives, and on_frame() drops it if it equals the rect
 * last sent.  Visibility is never coalesced.  Stacking is recomputed
 * from the store with a stable sort on z-index and sent only when the
 * resulting order differs from the last one sent.
 */
class BoundsSynchronizer
{
   public:
    BoundsSynchronizer(ViewClient& client, ChromeInsets insets = {});

    // Surface rect for a browser window, before pixel snapping.  Never
    // negative in either extent.
    static RectF content_rect(const WindowMeta& window, const ChromeInsets& insets);

    const ChromeInsets& insets() const { return insets_; }
    void                set_insets(const ChromeInsets& insets) { insets_ = insets; }

    // Queues the window's current layout for the next frame.
    void update_window(const WindowMeta& window);

    // Queues an explicit surface rect for the next frame.
    void update_geometry(WindowId id, const RectF& rect);

    // Sends every queued rect that changed.  Returns the number sent.
    size_t on_frame();

    // Sent immediately.
    void push_visibility(WindowId id, bool visible, bool focused);

    // Sends the ascending z-order of all browser windows if it changed.
    // Returns true if a restack was sent.
    bool sync_stacking(const WindowStore& store);

    // The view process's stack changed behind our back (a surface was
    // created or shown); the next sync_stacking() sends unconditionally.
    void invalidate_stacking() { stack_sent_ = false; }

    // Drops everything remembered about `id`, so the next update is sent
    // even if it matches what the previous view of the window received.
    void forget(WindowId id);

    size_t pending_count() const { return pending_.size(); }

    std::optional<Rect> last_sent(WindowId id) const;

    // Ascending z-order of browser windows; ties keep store order.
    static std::vector<ipc::RestackEntry> stacking_order(const WindowStore& store);

   private:
    ViewClient&  client_;
    ChromeInsets insets_;

    std::map<WindowId, Rect>       pending_;
    std::map<WindowId, Rect>       last_sent_;
    std::vector<ipc::RestackEntry> last_stack_;
    bool                           stack_sent_ = false;
};

}   // namespace tessera::ui
