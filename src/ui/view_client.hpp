#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>
#include <tessera/tab_state.hpp>
#include <vector>

#include "../ipc/message.hpp"
#include "../ipc/port.hpp"

namespace tessera::ui
{

// Outcome of one request.  `tab_id` is set for createTab, `image` for a
// successful captureSnapshot.
struct Reply
{
    ipc::ErrorCode          error = ipc::ErrorCode::None;
    std::string             message;
    TabId                   tab_id = INVALID_TAB_ID;
    std::optional<ImageRef> image;

    bool ok() const { return error == ipc::ErrorCode::None; }
};

using ReplyHandler = std::function<void(const Reply&)>;

/**
 * ViewClient — the UI process end of the view channel.
 *
 * Every request is validated before it is encoded: a zero window id,
 * an empty URL, negative extents or an unknown navigation action come
 * back as an ErrorCode from the call itself and nothing is sent.  A
 * request that was sent resolves exactly once through its handler:
 * with the view process's answer, with Timeout when no answer arrives
 * within the request timeout, or with Disconnected when the channel
 * goes away first.
 *
 * Replies may arrive in any order; handlers are matched by request id.
 */
class ViewClient
{
   public:
    using Clock = std::chrono::steady_clock;

    using StateHandler  = std::function<void(WindowId, const BrowserState&)>;
    using CrashHandler  = std::function<void(WindowId, TabId)>;
    using WindowHandler = std::function<void(WindowId)>;
    using VoidHandler   = std::function<void()>;

    ViewClient(ipc::MessagePort& port, std::chrono::milliseconds request_timeout);

    ViewClient(const ViewClient&)            = delete;
    ViewClient& operator=(const ViewClient&) = delete;

    // Sends HELLO.  Requests may be issued right away; the view process
    // handles them in order after the handshake.
    bool hello(const std::string& client_build);
    bool handshake_done() const { return handshake_done_; }
    bool is_connected() const { return port_.is_open() && !disconnected_; }

    // ─── Requests ────────────────────────────────────────────────────────

    ipc::ErrorCode create_view(WindowId           window_id,
                               const Rect&        bounds,
                               const std::string& initial_url,
                               ReplyHandler       done = nullptr);
    ipc::ErrorCode create_tab(WindowId                          window_id,
                              const std::optional<std::string>& url,
                              ReplyHandler                      done = nullptr);
    ipc::ErrorCode switch_tab(WindowId window_id, TabId tab_id, ReplyHandler done = nullptr);
    ipc::ErrorCode close_tab(WindowId window_id, TabId tab_id, ReplyHandler done = nullptr);
    ipc::ErrorCode load_url(WindowId           window_id,
                            const std::string& url,
                            NavSeq             nav_seq,
                            ReplyHandler       done = nullptr);
    ipc::ErrorCode navigate(WindowId window_id, NavigationAction action, ReplyHandler done = nullptr);
    ipc::ErrorCode navigate(WindowId window_id, std::string_view action, ReplyHandler done = nullptr);
    ipc::ErrorCode set_bounds(WindowId window_id, const Rect& bounds, ReplyHandler done = nullptr);
    ipc::ErrorCode set_visibility(WindowId     window_id,
                                  bool         is_visible,
                                  bool         is_focused,
                                  ReplyHandler done = nullptr);
    ipc::ErrorCode destroy_view(WindowId window_id, ReplyHandler done = nullptr);
    ipc::ErrorCode capture_snapshot(WindowId window_id, ReplyHandler done = nullptr);
    ipc::ErrorCode show_and_focus(WindowId window_id, ReplyHandler done = nullptr);
    ipc::ErrorCode restack_windows(const std::vector<ipc::RestackEntry>& windows,
                                   ReplyHandler                          done = nullptr);

    // ─── Events ──────────────────────────────────────────────────────────

    void set_state_handler(StateHandler h) { on_state_ = std::move(h); }
    void set_crash_handler(CrashHandler h) { on_crash_ = std::move(h); }
    void set_window_closed_handler(WindowHandler h) { on_window_closed_ = std::move(h); }
    void set_focus_handler(WindowHandler h) { on_focus_ = std::move(h); }
    void set_disconnect_handler(VoidHandler h) { on_disconnect_ = std::move(h); }

    // ─── Pump ────────────────────────────────────────────────────────────

    // Drains the port and dispatches replies and events.  Detects a
    // closed channel and fails everything still pending.
    size_t poll();

    // Dispatches a single message (exposed for tests).
    void handle(const ipc::Message& msg);

    // Expires overdue requests and sends heartbeats.  A request's
    // deadline starts at the first tick after it was sent.
    void tick(Clock::time_point now);

    size_t pending_count() const { return pending_.size(); }

   private:
    struct Pending
    {
        ipc::MessageType                 type = ipc::MessageType::HELLO;
        WindowId                         window_id = INVALID_WINDOW_ID;
        ReplyHandler                     done;
        std::optional<Clock::time_point> deadline;
    };

    ipc::ErrorCode request(ipc::MessageType     type,
                           WindowId             window_id,
                           std::vector<uint8_t> payload,
                           ReplyHandler         done);
    bool           send(ipc::MessageType     type,
                        WindowId             window_id,
                        ipc::RequestId       request_id,
                        std::vector<uint8_t> payload);
    void           resolve(ipc::RequestId request_id, Reply reply);
    void           fail_all(ipc::ErrorCode code);
    void           on_disconnected();

    ipc::MessagePort&         port_;
    std::chrono::milliseconds request_timeout_;

    ipc::RequestId                    next_request_id_ = 1;
    uint64_t                          seq_             = 0;
    ipc::SessionId                    session_id_      = ipc::INVALID_SESSION;
    ipc::RequestId                    hello_request_   = ipc::INVALID_REQUEST;
    bool                              handshake_done_  = false;
    bool                              disconnected_    = false;
    std::map<ipc::RequestId, Pending> pending_;

    std::chrono::milliseconds heartbeat_interval_{5000};
    Clock::time_point         last_heartbeat_sent_{};

    StateHandler  on_state_;
    CrashHandler  on_crash_;
    WindowHandler on_window_closed_;
    WindowHandler on_focus_;
    VoidHandler   on_disconnect_;
};

}   // namespace tessera::ui
