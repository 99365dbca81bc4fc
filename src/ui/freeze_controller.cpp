#include "freeze_controller.hpp"

#include <tessera/logger.hpp>

#include "view_client.hpp"
#include "window_store.hpp"

namespace tessera::ui
{

FreezeController::FreezeController(WindowId                  window_id,
                                   WindowStore&              store,
                                   ViewClient&               client,
                                   std::chrono::milliseconds capture_timeout)
    : window_id_(window_id), store_(store), client_(client), capture_timeout_(capture_timeout)
{
}

FreezeState FreezeController::state() const
{
    const auto* w = store_.find(window_id_);
    if (!w || !w->browser)
        return FreezeActive{};
    return w->browser->freeze;
}

bool FreezeController::window_focused() const
{
    const auto* w = store_.find(window_id_);
    return w && w->is_focused;
}

bool FreezeController::window_minimized() const
{
    const auto* w = store_.find(window_id_);
    return w && w->is_minimized;
}

void FreezeController::set_state(FreezeState state)
{
    store_.set_freeze_state(window_id_, std::move(state));
}

// ─── Triggers ────────────────────────────────────────────────────────────────

void FreezeController::on_focus_changed(bool focused)
{
    if (busy_)
    {
        TESSERA_LOG_DEBUG("freeze", "Window {} {} while {} is pending, deferring", window_id_,
                          focused ? "focused" : "blurred", freeze_state_name(state()));
        missed_edge_ = true;
        return;
    }
    evaluate();
}

void FreezeController::evaluate()
{
    FreezeState current = state();
    if (window_focused())
    {
        if (!is_active(current))
        {
            TESSERA_LOG_INFO("freeze", "Window {} gained focus, activating", window_id_);
            activate();
        }
        return;
    }
    if (is_active(current) && !window_minimized())
    {
        TESSERA_LOG_INFO("freeze", "Window {} lost focus, capturing", window_id_);
        begin_capture();
    }
}

// Runs after a capture or show completes.  Only an edge that arrived in
// the meantime can start another operation; a failed capture does not
// retry by itself.
void FreezeController::settle()
{
    if (busy_)
        return;
    if (missed_edge_)
    {
        missed_edge_ = false;
        evaluate();
        return;
    }
    // Focus regained while the capture was pending.
    if (window_focused() && !is_active(state()))
        activate();
}

void FreezeController::on_snapshot_painted(const std::string& image_name)
{
    FreezeState current = state();
    const auto* waiting = std::get_if<FreezeAwaitingRender>(&current);
    if (!waiting || waiting->snapshot.name != image_name)
    {
        TESSERA_LOG_DEBUG("freeze", "Ignoring paint of '{}' for window {} in {}", image_name,
                          window_id_, freeze_state_name(current));
        return;
    }
    TESSERA_LOG_DEBUG("freeze", "Snapshot painted for window {}, freezing", window_id_);
    set_state(FreezeFrozen{waiting->snapshot});
}

// ─── Capture ─────────────────────────────────────────────────────────────────

void FreezeController::begin_capture()
{
    set_state(FreezeCapturing{});
    busy_ = true;
    capture_deadline_.reset();
    ++capture_count_;

    uint64_t            generation = ++generation_;
    std::weak_ptr<bool> alive      = alive_;
    auto err = client_.capture_snapshot(window_id_,
                                        [this, alive, generation](const Reply& reply)
                                        {
                                            if (alive.expired())
                                                return;
                                            on_capture_result(generation, reply);
                                        });
    if (err != ipc::ErrorCode::None)
    {
        TESSERA_LOG_WARN("freeze", "Capture for window {} not sent: {}", window_id_,
                         ipc::to_string(err));
        busy_ = false;
        set_state(FreezeActive{});
    }
}

void FreezeController::on_capture_result(uint64_t generation, const Reply& reply)
{
    if (generation != generation_ || !busy_)
    {
        TESSERA_LOG_DEBUG("freeze", "Discarding stale capture result for window {}", window_id_);
        return;
    }
    busy_ = false;
    capture_deadline_.reset();

    if (!std::holds_alternative<FreezeCapturing>(state()))
    {
        settle();
        return;
    }

    if (reply.ok() && reply.image)
    {
        set_state(FreezeAwaitingRender{*reply.image});
    }
    else
    {
        if (reply.ok())
            TESSERA_LOG_INFO("freeze", "No snapshot for window {}, staying live", window_id_);
        else
            TESSERA_LOG_WARN("freeze", "Capture for window {} failed: {}", window_id_,
                             ipc::to_string(reply.error));
        set_state(FreezeActive{});
    }
    settle();
}

void FreezeController::tick(Clock::time_point now)
{
    if (!busy_ || !std::holds_alternative<FreezeCapturing>(state()))
        return;

    if (!capture_deadline_)
    {
        capture_deadline_ = now + capture_timeout_;
        return;
    }
    if (now < *capture_deadline_)
        return;

    TESSERA_LOG_WARN("freeze", "Capture for window {} timed out after {} ms, staying live",
                     window_id_, static_cast<long long>(capture_timeout_.count()));
    ++generation_;
    busy_ = false;
    capture_deadline_.reset();
    set_state(FreezeActive{});
    settle();
}

// ─── Restore ─────────────────────────────────────────────────────────────────

void FreezeController::activate()
{
    set_state(FreezeActive{});
    busy_ = true;
    ++show_count_;

    uint64_t            generation = ++generation_;
    std::weak_ptr<bool> alive      = alive_;
    auto err = client_.show_and_focus(window_id_,
                                      [this, alive, generation](const Reply& reply)
                                      {
                                          if (alive.expired())
                                              return;
                                          on_show_result(generation, reply);
                                      });
    if (err != ipc::ErrorCode::None)
    {
        TESSERA_LOG_WARN("freeze", "showAndFocus for window {} not sent: {}", window_id_,
                         ipc::to_string(err));
        busy_ = false;
    }
}

void FreezeController::on_show_result(uint64_t generation, const Reply& reply)
{
    if (generation != generation_)
        return;
    busy_ = false;
    if (!reply.ok())
        TESSERA_LOG_WARN("freeze", "showAndFocus for window {} failed: {}", window_id_,
                         ipc::to_string(reply.error));
    settle();
}

}   // namespace tessera::ui
