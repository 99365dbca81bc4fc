#pragma once

#include <compare>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>
#include <vector>

#include "surface_host.hpp"

namespace tessera::view
{

/**
 * ViewRegistry — sole owner of every live Surface, keyed by (window, tab).
 *
 * Attachment order on the SurfaceHost is the z-order, so the registry is
 * also the only place that attaches and detaches surfaces.  Create is
 * idempotent and destroy tolerates unknown keys: a UI component that
 * mounts twice must not end up with two surfaces over the same region.
 *
 * Single-threaded: called from the view process loop only.
 */
class ViewRegistry
{
   public:
    struct Key
    {
        WindowId window_id = INVALID_WINDOW_ID;
        TabId    tab_id    = INVALID_TAB_ID;

        auto operator<=>(const Key&) const = default;
    };

    // One row of a restack request, already resolved to the window's
    // active tab.  Hidden rows are detached instead of reordered.
    struct StackEntry
    {
        WindowId window_id = INVALID_WINDOW_ID;
        TabId    tab_id    = INVALID_TAB_ID;
        bool     hidden    = false;
    };

    using EventHandler = std::function<void(WindowId, TabId, const SurfaceEvent&)>;
    using CrashHandler = std::function<void(WindowId, TabId)>;

    explicit ViewRegistry(SurfaceHost& host);
    ~ViewRegistry();

    ViewRegistry(const ViewRegistry&)            = delete;
    ViewRegistry& operator=(const ViewRegistry&) = delete;

    // Creates, attaches on top and starts loading `initial_url` (if not
    // empty).  Returns the existing surface if one is already registered.
    Surface* create_surface(WindowId window_id, TabId tab_id, const std::string& initial_url);

    // Detaches and releases.  Returns false if nothing was registered.
    bool destroy_surface(WindowId window_id, TabId tab_id);

    // Destroys every surface of a window.  Returns the number released.
    size_t destroy_window(WindowId window_id);

    // Rejects negative extents and non-finite values; rounds the rest.
    bool set_bounds(WindowId window_id, TabId tab_id, const RectF& bounds);

    // Visible surfaces are attached (on top if newly attached); hidden
    // ones are detached so they stop compositing altogether.
    bool set_visible(WindowId window_id, TabId tab_id, bool visible);

    // Entries in ascending z-order; the last one ends up topmost.
    // Returns true if the compositing tree changed.
    bool restack(const std::vector<StackEntry>& ordered);

    // Position of the surface among the host's children, bottom first.
    // nullopt when it is not attached.
    std::optional<size_t> stack_slot(WindowId window_id, TabId tab_id) const;

    // Shows the surface at `slot` in the compositing stack; surfaces at
    // and above that slot move up by one.  A tab that replaces its
    // window's active surface takes over the old surface's slot, so
    // tab operations never change the stacking between windows.
    bool attach_at(WindowId window_id, TabId tab_id, size_t slot);

    Surface* find(WindowId window_id, TabId tab_id) const;
    bool     contains(WindowId window_id, TabId tab_id) const;
    bool     is_attached(WindowId window_id, TabId tab_id) const;
    size_t   count() const { return surfaces_.size(); }
    size_t   count_for_window(WindowId window_id) const;

    void set_event_handler(EventHandler handler) { event_handler_ = std::move(handler); }
    void set_crash_handler(CrashHandler handler) { crash_handler_ = std::move(handler); }

    SurfaceHost& host() { return host_; }

   private:
    void on_surface_event(WindowId window_id, TabId tab_id, const SurfaceEvent& ev);

    SurfaceHost&                             host_;
    std::map<Key, std::unique_ptr<Surface>> surfaces_;
    EventHandler                             event_handler_;
    CrashHandler                             crash_handler_;
};

}   // namespace tessera::view
