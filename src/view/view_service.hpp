#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <tessera/fwd.hpp>

#include "../core/config.hpp"
#include "../ipc/message.hpp"
#include "../ipc/port.hpp"
#include "snapshot_service.hpp"
#include "tab_manager.hpp"
#include "view_registry.hpp"

namespace tessera::view
{

/**
 * ViewService — the view process side of the channel.
 *
 * Validates each request at the boundary, dispatches it to TabManager,
 * ViewRegistry or SnapshotService, and answers with exactly one
 * response carrying the request id.  TabManager state changes, crashes,
 * focus and window-closed notifications go back out as events.
 *
 * One UI client at a time; attach() replaces the previous port.
 */
class ViewService
{
   public:
    using Clock = std::chrono::steady_clock;

    ViewService(SurfaceHost& host, ipc::BlobStore& blobs, const Config& config);
    ~ViewService();

    ViewService(const ViewService&)            = delete;
    ViewService& operator=(const ViewService&) = delete;

    // Non-owning.  Pass nullptr to detach.
    void attach(ipc::MessagePort* port);

    // Drains the port.  Returns the number of messages handled.
    size_t poll();

    // Dispatches a single message (exposed for tests).
    void handle(const ipc::Message& msg);

    // Heartbeats out, stale-client detection in.
    void tick(Clock::time_point now);

    bool handshake_done() const { return handshake_done_; }
    bool client_stale() const { return client_stale_; }

    TabManager&      tabs() { return tabs_; }
    ViewRegistry&    registry() { return registry_; }
    SnapshotService& snapshots() { return snapshots_; }

   private:
    void on_hello(const ipc::Message& msg);
    void dispatch_request(const ipc::Message& msg);

    void reply_ok(ipc::RequestId request_id);
    void reply_err(ipc::RequestId request_id, ipc::ErrorCode code, const std::string& message);
    void reply_result(ipc::RequestId request_id, ipc::ErrorCode code, const char* what);
    bool send(ipc::MessageType type, WindowId window_id, ipc::RequestId request_id,
              std::vector<uint8_t> payload);

    void emit_state_changed(WindowId window_id, const BrowserState& state);

    // Declaration order matters: snapshots outlive the registry so a
    // capture completing during teardown still finds its service.
    SnapshotService snapshots_;
    ViewRegistry    registry_;
    TabManager      tabs_;

    ipc::MessagePort* port_ = nullptr;
    uint64_t          seq_  = 0;
    ipc::SessionId    session_id_     = ipc::INVALID_SESSION;
    ipc::SessionId    next_session_   = 1;
    bool              handshake_done_ = false;

    std::chrono::milliseconds heartbeat_interval_;
    Clock::time_point         last_heartbeat_sent_{};
    Clock::time_point         last_client_activity_{};
    bool                      activity_seen_ = true;
    bool                      client_stale_  = false;
};

}   // namespace tessera::view
