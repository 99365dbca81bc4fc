#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tessera/fwd.hpp>

#include "freeze_state.hpp"

namespace tessera::ui
{

class ViewClient;
class WindowStore;
struct Reply;

/**
 * FreezeController — swaps a browser window's live surface for a
 * snapshot while the window is not focused.
 *
 *   blur (not minimized)   ACTIVE → CAPTURING, captureSnapshot sent
 *   snapshot returned      CAPTURING → AWAITING_RENDER
 *   capture failed/timeout CAPTURING → ACTIVE, surface never hidden
 *   snapshot painted       AWAITING_RENDER → FROZEN
 *   focus                  any → ACTIVE, showAndFocus sent once
 *
 * The state lives in the WindowStore; this class only drives it.  One
 * capture or show is in flight at a time.  A focus edge that arrives
 * while one is pending is dropped, and the window's focus is evaluated
 * again once the pending operation settles.
 */
class FreezeController
{
   public:
    using Clock = std::chrono::steady_clock;

    FreezeController(WindowId                  window_id,
                     WindowStore&              store,
                     ViewClient&               client,
                     std::chrono::milliseconds capture_timeout);

    FreezeController(const FreezeController&)            = delete;
    FreezeController& operator=(const FreezeController&) = delete;

    // Called on every focus edge of this window, after the store has
    // been updated.
    void on_focus_changed(bool focused);

    // The UI finished painting the snapshot named `image_name`.
    void on_snapshot_painted(const std::string& image_name);

    // Fails a capture that has been pending longer than the timeout.
    // The timeout starts at the first tick after the capture was sent.
    void tick(Clock::time_point now);

    FreezeState state() const;
    bool        busy() const { return busy_; }
    WindowId    window_id() const { return window_id_; }

    uint64_t capture_count() const { return capture_count_; }
    uint64_t show_count() const { return show_count_; }

   private:
    void evaluate();
    void settle();
    void begin_capture();
    void activate();
    void on_capture_result(uint64_t generation, const Reply& reply);
    void on_show_result(uint64_t generation, const Reply& reply);
    void set_state(FreezeState state);

    bool window_focused() const;
    bool window_minimized() const;

    WindowId                  window_id_;
    WindowStore&              store_;
    ViewClient&               client_;
    std::chrono::milliseconds capture_timeout_;

    bool                             busy_        = false;
    bool                             missed_edge_ = false;
    uint64_t                         generation_  = 0;
    std::optional<Clock::time_point> capture_deadline_;

    uint64_t capture_count_ = 0;
    uint64_t show_count_    = 0;

    // Replies for a destroyed controller are ignored.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}   // namespace tessera::ui
