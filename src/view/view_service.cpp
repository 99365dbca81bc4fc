#include "view_service.hpp"

#include <tessera/logger.hpp>
#include <unistd.h>

#include "../ipc/codec.hpp"

namespace tessera::view
{

using ipc::ErrorCode;
using ipc::MessageType;

// Heartbeats missed before the client is reported stale.
static constexpr int STALE_HEARTBEATS = 3;

ViewService::ViewService(SurfaceHost& host, ipc::BlobStore& blobs, const Config& config)
    : snapshots_(blobs, config.max_snapshots),
      registry_(host),
      tabs_(registry_, config.default_new_tab_url),
      heartbeat_interval_(config.heartbeat_ms)
{
    tabs_.set_state_handler([this](WindowId w, const BrowserState& state)
                            { emit_state_changed(w, state); });

    tabs_.set_window_closed_handler(
        [this](WindowId w)
        {
            snapshots_.clear_window(w);
            send(MessageType::EVT_WINDOW_CLOSED, w, ipc::INVALID_REQUEST,
                 ipc::encode_evt_window({w}));
        });

    tabs_.set_focus_handler(
        [this](WindowId w)
        {
            send(MessageType::EVT_VIEW_FOCUSED, w, ipc::INVALID_REQUEST,
                 ipc::encode_evt_window({w}));
        });

    tabs_.set_crash_handler(
        [this](WindowId w, TabId t)
        {
            send(MessageType::EVT_SURFACE_CRASHED, w, ipc::INVALID_REQUEST,
                 ipc::encode_evt_surface_crashed({w, t}));
        });
}

ViewService::~ViewService()
{
    tabs_.set_state_handler(nullptr);
    tabs_.set_window_closed_handler(nullptr);
    tabs_.set_focus_handler(nullptr);
    tabs_.set_crash_handler(nullptr);
}

void ViewService::attach(ipc::MessagePort* port)
{
    port_           = port;
    handshake_done_ = false;
    session_id_     = ipc::INVALID_SESSION;
    activity_seen_  = true;
    client_stale_   = false;
}

size_t ViewService::poll()
{
    size_t handled = 0;
    while (port_ && port_->is_open())
    {
        auto msg = port_->poll();
        if (!msg)
            break;
        handle(*msg);
        ++handled;
    }
    return handled;
}

// ─── Dispatch ────────────────────────────────────────────────────────────────

void ViewService::handle(const ipc::Message& msg)
{
    activity_seen_ = true;
    client_stale_  = false;

    if (msg.header.type == MessageType::HELLO)
    {
        on_hello(msg);
        return;
    }
    if (msg.header.type == MessageType::EVT_HEARTBEAT)
        return;

    if (!handshake_done_)
    {
        TESSERA_LOG_WARN("viewd", "{} before handshake, rejecting", ipc::to_string(msg.header.type));
        reply_err(msg.header.request_id, ErrorCode::InvalidArgument, "handshake required");
        return;
    }
    dispatch_request(msg);
}

void ViewService::on_hello(const ipc::Message& msg)
{
    auto hello = ipc::decode_hello(msg.payload);
    if (!hello || hello->protocol_major != ipc::PROTOCOL_MAJOR)
    {
        TESSERA_LOG_ERROR("viewd",
                          "Protocol mismatch: client major {}, ours {}",
                          hello ? hello->protocol_major : 0,
                          ipc::PROTOCOL_MAJOR);
        reply_err(msg.header.request_id, ErrorCode::InvalidArgument, "protocol version mismatch");
        if (port_)
            port_->close();
        return;
    }

    session_id_     = next_session_++;
    handshake_done_ = true;

    ipc::WelcomePayload welcome;
    welcome.session_id   = session_id_;
    welcome.process_id   = static_cast<ipc::ProcessId>(::getpid());
    welcome.heartbeat_ms = static_cast<uint32_t>(heartbeat_interval_.count());
    send(MessageType::WELCOME, INVALID_WINDOW_ID, msg.header.request_id, ipc::encode_welcome(welcome));

    TESSERA_LOG_INFO("viewd", "Client '{}' connected, session {}", hello->client_build, session_id_);
}

void ViewService::dispatch_request(const ipc::Message& msg)
{
    const auto req = msg.header.request_id;
    auto       malformed = [&]()
    {
        TESSERA_LOG_WARN("viewd", "Malformed {} payload", ipc::to_string(msg.header.type));
        reply_err(req, ErrorCode::InvalidArgument, "malformed payload");
    };

    switch (msg.header.type)
    {
        case MessageType::REQ_CREATE_VIEW:
        {
            auto p = ipc::decode_req_create_view(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.create_view(p->window_id, p->bounds, p->initial_url), "createView");
            return;
        }
        case MessageType::REQ_CREATE_TAB:
        {
            auto p = ipc::decode_req_create_tab(msg.payload);
            if (!p)
                return malformed();
            auto result = tabs_.create_tab(p->window_id, p->url);
            if (result.error != ErrorCode::None)
            {
                reply_result(req, result.error, "createTab");
                return;
            }
            send(MessageType::RESP_CREATE_TAB, p->window_id, req,
                 ipc::encode_resp_create_tab({req, result.tab_id}));
            return;
        }
        case MessageType::REQ_SWITCH_TAB:
        {
            auto p = ipc::decode_req_tab(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.switch_tab(p->window_id, p->tab_id), "switchTab");
            return;
        }
        case MessageType::REQ_CLOSE_TAB:
        {
            auto p = ipc::decode_req_tab(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.close_tab(p->window_id, p->tab_id), "closeTab");
            return;
        }
        case MessageType::REQ_LOAD_URL:
        {
            auto p = ipc::decode_req_load_url(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.load_url(p->window_id, p->url, p->nav_seq), "loadUrl");
            return;
        }
        case MessageType::REQ_NAVIGATE:
        {
            auto p = ipc::decode_req_navigate(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.navigate(p->window_id, p->action), "navigate");
            return;
        }
        case MessageType::REQ_SET_BOUNDS:
        {
            auto p = ipc::decode_req_set_bounds(msg.payload);
            if (!p)
                return malformed();
            const Rect& r = p->bounds;
            RectF       bounds{static_cast<double>(r.x),
                         static_cast<double>(r.y),
                         static_cast<double>(r.width),
                         static_cast<double>(r.height)};
            reply_result(req, tabs_.set_bounds(p->window_id, bounds), "setBounds");
            return;
        }
        case MessageType::REQ_SET_VISIBILITY:
        {
            auto p = ipc::decode_req_set_visibility(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.set_visibility(p->window_id, p->is_visible, p->is_focused),
                         "setVisibility");
            return;
        }
        case MessageType::REQ_DESTROY_VIEW:
        {
            auto p = ipc::decode_req_window(msg.payload);
            if (!p)
                return malformed();
            snapshots_.clear_window(p->window_id);
            tabs_.destroy_view(p->window_id);
            reply_ok(req);
            return;
        }
        case MessageType::REQ_CAPTURE_SNAPSHOT:
        {
            auto p = ipc::decode_req_window(msg.payload);
            if (!p)
                return malformed();
            WindowId        w   = p->window_id;
            const TabState* tab = tabs_.active_tab(w);
            std::string     url = tab ? tab->url : std::string();
            snapshots_.capture(w,
                               tabs_.active_surface(w),
                               url,
                               [this, w, req](std::optional<ImageRef> image)
                               {
                                   send(MessageType::RESP_SNAPSHOT, w, req,
                                        ipc::encode_resp_snapshot({req, std::move(image)}));
                               });
            return;
        }
        case MessageType::REQ_SHOW_AND_FOCUS:
        {
            auto p = ipc::decode_req_window(msg.payload);
            if (!p)
                return malformed();
            reply_result(req, tabs_.show_and_focus(p->window_id), "showAndFocus");
            return;
        }
        case MessageType::REQ_RESTACK_WINDOWS:
        {
            auto p = ipc::decode_req_restack_windows(msg.payload);
            if (!p)
                return malformed();
            tabs_.restack(p->windows);
            reply_ok(req);
            return;
        }
        default:
            TESSERA_LOG_WARN("viewd", "Unexpected message {}", ipc::to_string(msg.header.type));
            reply_err(req, ErrorCode::InvalidArgument, "unexpected message type");
            return;
    }
}

// ─── Outgoing ────────────────────────────────────────────────────────────────

void ViewService::reply_ok(ipc::RequestId request_id)
{
    send(MessageType::RESP_OK, INVALID_WINDOW_ID, request_id, ipc::encode_resp_ok({request_id}));
}

void ViewService::reply_err(ipc::RequestId     request_id,
                            ipc::ErrorCode     code,
                            const std::string& message)
{
    ipc::RespErrPayload p;
    p.request_id = request_id;
    p.code       = code;
    p.message    = message;
    send(MessageType::RESP_ERR, INVALID_WINDOW_ID, request_id, ipc::encode_resp_err(p));
}

void ViewService::reply_result(ipc::RequestId request_id, ipc::ErrorCode code, const char* what)
{
    if (code == ErrorCode::None)
    {
        reply_ok(request_id);
        return;
    }
    TESSERA_LOG_DEBUG("viewd", "{} failed: {}", what, ipc::to_string(code));
    reply_err(request_id, code, std::string(what) + ": " + ipc::to_string(code));
}

bool ViewService::send(ipc::MessageType     type,
                       WindowId             window_id,
                       ipc::RequestId       request_id,
                       std::vector<uint8_t> payload)
{
    if (!port_ || !port_->is_open())
        return false;

    ipc::Message msg;
    msg.header.type        = type;
    msg.header.seq         = ++seq_;
    msg.header.request_id  = request_id;
    msg.header.session_id  = session_id_;
    msg.header.window_id   = window_id;
    msg.payload            = std::move(payload);
    msg.header.payload_len = static_cast<uint32_t>(msg.payload.size());

    if (!port_->send(msg))
    {
        TESSERA_LOG_WARN("viewd", "Failed to send {}", ipc::to_string(type));
        return false;
    }
    return true;
}

void ViewService::emit_state_changed(WindowId window_id, const BrowserState& state)
{
    ipc::EvtStateChangedPayload p;
    p.window_id = window_id;
    p.state     = state;
    send(MessageType::EVT_STATE_CHANGED, window_id, ipc::INVALID_REQUEST,
         ipc::encode_evt_state_changed(p));
}

// ─── Heartbeat ───────────────────────────────────────────────────────────────

void ViewService::tick(Clock::time_point now)
{
    if (!handshake_done_)
        return;

    if (activity_seen_)
    {
        last_client_activity_ = now;
        activity_seen_        = false;
    }
    else if (!client_stale_ && now - last_client_activity_ > heartbeat_interval_ * STALE_HEARTBEATS)
    {
        client_stale_ = true;
        TESSERA_LOG_WARN("viewd", "Client missed {} heartbeats", STALE_HEARTBEATS);
    }

    if (now - last_heartbeat_sent_ >= heartbeat_interval_)
    {
        last_heartbeat_sent_ = now;
        send(MessageType::EVT_HEARTBEAT, INVALID_WINDOW_ID, ipc::INVALID_REQUEST, {});
    }
}

}   // namespace tessera::view
