#pragma once

#include <map>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>

#include "view_client.hpp"

namespace tessera::ui
{

/**
 * ViewLifecycle — create/destroy of view-process views, serialized per
 * window against the latest desired state.
 *
 * mount() and unmount() only record what the UI wants.  At most one
 * createView or destroyView per window is in flight; when it settles the
 * lifecycle compares the view's actual state with the desired one and
 * sends whatever is still needed.  So create-then-destroy before the
 * create resolves ends with no view, and mount/unmount/mount ends with
 * one view whose on_created handler belongs to the last mount.
 */
class ViewLifecycle
{
   public:
    explicit ViewLifecycle(ViewClient& client);

    ViewLifecycle(const ViewLifecycle&)            = delete;
    ViewLifecycle& operator=(const ViewLifecycle&) = delete;

    // Replaces any earlier mount's handler; it runs once, when a create
    // for this mount settles.
    void mount(WindowId window_id, const Rect& bounds, const std::string& initial_url,
               ReplyHandler on_created = nullptr);
    void unmount(WindowId window_id);

    // The view process tore the window down on its own.
    void forget(WindowId window_id);

    bool   is_live(WindowId window_id) const;
    bool   is_busy(WindowId window_id) const;
    size_t tracked_count() const { return entries_.size(); }

    uint64_t creates_sent() const { return creates_sent_; }
    uint64_t destroys_sent() const { return destroys_sent_; }

   private:
    struct Entry
    {
        bool         desired   = false;
        bool         live      = false;
        bool         in_flight = false;
        bool         remount   = false;   // mounted again while a create was pending
        Rect         bounds;
        std::string  initial_url;
        ReplyHandler on_created;
    };

    void drive(WindowId window_id);
    void send_create(WindowId window_id, Entry& entry);
    void send_destroy(WindowId window_id, Entry& entry);
    void on_created(WindowId window_id, const Reply& reply);
    void on_destroyed(WindowId window_id, const Reply& reply);

    ViewClient&               client_;
    std::map<WindowId, Entry> entries_;
    uint64_t                  creates_sent_  = 0;
    uint64_t                  destroys_sent_ = 0;
};

}   // namespace tessera::ui
