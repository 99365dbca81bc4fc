#include "view_lifecycle.hpp"

#include <tessera/logger.hpp>

namespace tessera::ui
{

ViewLifecycle::ViewLifecycle(ViewClient& client) : client_(client) {}

void ViewLifecycle::mount(WindowId           window_id,
                          const Rect&        bounds,
                          const std::string& initial_url,
                          ReplyHandler       on_created)
{
    Entry& e      = entries_[window_id];
    e.desired     = true;
    e.remount     = true;
    e.bounds      = bounds;
    e.initial_url = initial_url;
    e.on_created  = std::move(on_created);
    TESSERA_LOG_DEBUG("lifecycle", "Mount window {}{}", window_id,
                      e.in_flight ? " (deferred)" : "");
    drive(window_id);
}

void ViewLifecycle::unmount(WindowId window_id)
{
    auto it = entries_.find(window_id);
    if (it == entries_.end())
        return;
    Entry& e     = it->second;
    e.desired    = false;
    e.remount    = false;
    e.on_created = nullptr;
    TESSERA_LOG_DEBUG("lifecycle", "Unmount window {}{}", window_id,
                      e.in_flight ? " (deferred)" : "");
    drive(window_id);
}

void ViewLifecycle::forget(WindowId window_id)
{
    auto it = entries_.find(window_id);
    if (it == entries_.end())
        return;
    it->second.live = false;
    if (!it->second.in_flight && !it->second.desired)
        entries_.erase(it);
}

bool ViewLifecycle::is_live(WindowId window_id) const
{
    auto it = entries_.find(window_id);
    return it != entries_.end() && it->second.live;
}

bool ViewLifecycle::is_busy(WindowId window_id) const
{
    auto it = entries_.find(window_id);
    return it != entries_.end() && it->second.in_flight;
}

// ─── Reconcile desired against actual ────────────────────────────────────────

void ViewLifecycle::drive(WindowId window_id)
{
    auto it = entries_.find(window_id);
    if (it == entries_.end())
        return;
    Entry& e = it->second;
    if (e.in_flight)
        return;

    if (e.desired && e.remount)
        send_create(window_id, e);
    else if (!e.desired && e.live)
        send_destroy(window_id, e);
    else if (!e.desired)
        entries_.erase(it);
}

void ViewLifecycle::send_create(WindowId window_id, Entry& e)
{
    e.remount   = false;
    e.in_flight = true;
    ++creates_sent_;

    auto err = client_.create_view(window_id, e.bounds, e.initial_url,
                                   [this, window_id](const Reply& reply)
                                   { on_created(window_id, reply); });
    if (err == ipc::ErrorCode::None)
        return;

    TESSERA_LOG_WARN("lifecycle", "createView for window {} not sent: {}", window_id,
                     ipc::to_string(err));
    e.in_flight          = false;
    ReplyHandler handler = std::move(e.on_created);
    e.on_created         = nullptr;
    if (handler)
    {
        Reply reply;
        reply.error   = err;
        reply.message = ipc::to_string(err);
        handler(reply);
    }
}

void ViewLifecycle::send_destroy(WindowId window_id, Entry& e)
{
    e.in_flight = true;
    ++destroys_sent_;

    auto err = client_.destroy_view(window_id, [this, window_id](const Reply& reply)
                                    { on_destroyed(window_id, reply); });
    if (err == ipc::ErrorCode::None)
        return;

    // Nothing to talk to; the view is as good as gone.
    TESSERA_LOG_DEBUG("lifecycle", "destroyView for window {} not sent: {}", window_id,
                      ipc::to_string(err));
    e.in_flight = false;
    e.live      = false;
    entries_.erase(window_id);
}

void ViewLifecycle::on_created(WindowId window_id, const Reply& reply)
{
    auto it = entries_.find(window_id);
    if (it == entries_.end())
        return;
    Entry& e    = it->second;
    e.in_flight = false;
    if (reply.ok())
        e.live = true;
    else
        TESSERA_LOG_WARN("lifecycle", "createView for window {} failed: {}", window_id,
                         reply.message);

    // A newer mount has its own create coming; only the final one reports.
    ReplyHandler handler;
    if (e.desired && !e.remount)
    {
        handler      = std::move(e.on_created);
        e.on_created = nullptr;
    }

    drive(window_id);
    if (handler)
        handler(reply);
}

void ViewLifecycle::on_destroyed(WindowId window_id, const Reply& reply)
{
    auto it = entries_.find(window_id);
    if (it == entries_.end())
        return;
    if (!reply.ok())
        TESSERA_LOG_DEBUG("lifecycle", "destroyView for window {}: {}", window_id, reply.message);
    it->second.in_flight = false;
    it->second.live      = false;
    drive(window_id);
}

}   // namespace tessera::ui
