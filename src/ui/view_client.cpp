#include "view_client.hpp"

#include <tessera/logger.hpp>

#include "../core/url.hpp"
#include "../ipc/codec.hpp"

namespace tessera::ui
{

using ipc::ErrorCode;
using ipc::MessageType;

namespace
{

bool valid_extent(const Rect& r)
{
    return r.width >= 0 && r.height >= 0;
}

bool blank(const std::string& url)
{
    return trim(url).empty();
}

}   // namespace

ViewClient::ViewClient(ipc::MessagePort& port, std::chrono::milliseconds request_timeout)
    : port_(port), request_timeout_(request_timeout)
{
}

bool ViewClient::hello(const std::string& client_build)
{
    ipc::HelloPayload p;
    p.client_build = client_build;

    hello_request_ = next_request_id_++;
    Pending pending;
    pending.type = MessageType::HELLO;
    pending_.emplace(hello_request_, std::move(pending));

    if (!send(MessageType::HELLO, INVALID_WINDOW_ID, hello_request_, ipc::encode_hello(p)))
    {
        pending_.erase(hello_request_);
        return false;
    }
    return true;
}

// ─── Requests ────────────────────────────────────────────────────────────────

ErrorCode ViewClient::create_view(WindowId           window_id,
                                  const Rect&        bounds,
                                  const std::string& initial_url,
                                  ReplyHandler       done)
{
    if (window_id == INVALID_WINDOW_ID || !valid_extent(bounds))
        return ErrorCode::InvalidArgument;

    ipc::ReqCreateViewPayload p;
    p.window_id   = window_id;
    p.bounds      = bounds;
    p.initial_url = initial_url;
    return request(MessageType::REQ_CREATE_VIEW, window_id, ipc::encode_req_create_view(p),
                   std::move(done));
}

ErrorCode ViewClient::create_tab(WindowId                          window_id,
                                 const std::optional<std::string>& url,
                                 ReplyHandler                      done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    if (url && blank(*url))
        return ErrorCode::InvalidUrl;

    ipc::ReqCreateTabPayload p;
    p.window_id = window_id;
    p.url       = url;
    return request(MessageType::REQ_CREATE_TAB, window_id, ipc::encode_req_create_tab(p),
                   std::move(done));
}

ErrorCode ViewClient::switch_tab(WindowId window_id, TabId tab_id, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID || tab_id == INVALID_TAB_ID)
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_SWITCH_TAB, window_id, ipc::encode_req_tab({window_id, tab_id}),
                   std::move(done));
}

ErrorCode ViewClient::close_tab(WindowId window_id, TabId tab_id, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID || tab_id == INVALID_TAB_ID)
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_CLOSE_TAB, window_id, ipc::encode_req_tab({window_id, tab_id}),
                   std::move(done));
}

ErrorCode ViewClient::load_url(WindowId           window_id,
                               const std::string& url,
                               NavSeq             nav_seq,
                               ReplyHandler       done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    if (blank(url))
        return ErrorCode::InvalidUrl;

    ipc::ReqLoadUrlPayload p;
    p.window_id = window_id;
    p.url       = url;
    p.nav_seq   = nav_seq;
    return request(MessageType::REQ_LOAD_URL, window_id, ipc::encode_req_load_url(p),
                   std::move(done));
}

ErrorCode ViewClient::navigate(WindowId window_id, NavigationAction action, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_NAVIGATE, window_id,
                   ipc::encode_req_navigate({window_id, action}), std::move(done));
}

ErrorCode ViewClient::navigate(WindowId window_id, std::string_view action, ReplyHandler done)
{
    auto parsed = parse_navigation_action(action);
    if (!parsed)
    {
        TESSERA_LOG_WARN("ipc", "Rejecting unknown navigation action '{}'", action);
        return ErrorCode::InvalidArgument;
    }
    return navigate(window_id, *parsed, std::move(done));
}

ErrorCode ViewClient::set_bounds(WindowId window_id, const Rect& bounds, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID || !valid_extent(bounds))
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_SET_BOUNDS, window_id,
                   ipc::encode_req_set_bounds({window_id, bounds}), std::move(done));
}

ErrorCode ViewClient::set_visibility(WindowId     window_id,
                                     bool         is_visible,
                                     bool         is_focused,
                                     ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    ipc::ReqSetVisibilityPayload p;
    p.window_id  = window_id;
    p.is_visible = is_visible;
    p.is_focused = is_focused;
    return request(MessageType::REQ_SET_VISIBILITY, window_id, ipc::encode_req_set_visibility(p),
                   std::move(done));
}

ErrorCode ViewClient::destroy_view(WindowId window_id, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_DESTROY_VIEW, window_id, ipc::encode_req_window({window_id}),
                   std::move(done));
}

ErrorCode ViewClient::capture_snapshot(WindowId window_id, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_CAPTURE_SNAPSHOT, window_id,
                   ipc::encode_req_window({window_id}), std::move(done));
}

ErrorCode ViewClient::show_and_focus(WindowId window_id, ReplyHandler done)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;
    return request(MessageType::REQ_SHOW_AND_FOCUS, window_id, ipc::encode_req_window({window_id}),
                   std::move(done));
}

ErrorCode ViewClient::restack_windows(const std::vector<ipc::RestackEntry>& windows,
                                      ReplyHandler                          done)
{
    for (const auto& entry : windows)
    {
        if (entry.window_id == INVALID_WINDOW_ID)
            return ErrorCode::InvalidArgument;
    }
    ipc::ReqRestackWindowsPayload p;
    p.windows = windows;
    return request(MessageType::REQ_RESTACK_WINDOWS, INVALID_WINDOW_ID,
                   ipc::encode_req_restack_windows(p), std::move(done));
}

ErrorCode ViewClient::request(MessageType          type,
                              WindowId             window_id,
                              std::vector<uint8_t> payload,
                              ReplyHandler         done)
{
    if (disconnected_ || !port_.is_open())
        return ErrorCode::Disconnected;

    ipc::RequestId id = next_request_id_++;
    if (!send(type, window_id, id, std::move(payload)))
        return ErrorCode::Disconnected;

    Pending pending;
    pending.type      = type;
    pending.window_id = window_id;
    pending.done      = std::move(done);
    pending_.emplace(id, std::move(pending));
    return ErrorCode::None;
}

bool ViewClient::send(MessageType          type,
                      WindowId             window_id,
                      ipc::RequestId       request_id,
                      std::vector<uint8_t> payload)
{
    ipc::Message msg;
    msg.header.type        = type;
    msg.header.seq         = ++seq_;
    msg.header.request_id  = request_id;
    msg.header.session_id  = session_id_;
    msg.header.window_id   = window_id;
    msg.payload            = std::move(payload);
    msg.header.payload_len = static_cast<uint32_t>(msg.payload.size());

    if (!port_.send(msg))
    {
        TESSERA_LOG_WARN("ipc", "Failed to send {}", ipc::to_string(type));
        return false;
    }
    return true;
}

// ─── Incoming ────────────────────────────────────────────────────────────────

size_t ViewClient::poll()
{
    size_t handled = 0;
    while (!disconnected_)
    {
        auto msg = port_.poll();
        if (!msg)
            break;
        handle(*msg);
        ++handled;
    }
    if (!disconnected_ && !port_.is_open())
        on_disconnected();
    return handled;
}

void ViewClient::handle(const ipc::Message& msg)
{
    const auto req = msg.header.request_id;

    switch (msg.header.type)
    {
        case MessageType::WELCOME:
        {
            auto p = ipc::decode_welcome(msg.payload);
            if (!p)
            {
                TESSERA_LOG_ERROR("ipc", "Malformed WELCOME");
                return;
            }
            session_id_     = p->session_id;
            handshake_done_ = true;
            if (p->heartbeat_ms > 0)
                heartbeat_interval_ = std::chrono::milliseconds(p->heartbeat_ms);
            pending_.erase(req);
            TESSERA_LOG_INFO("ipc", "Connected to view process pid {}, session {}", p->process_id,
                             p->session_id);
            return;
        }
        case MessageType::RESP_OK:
            resolve(req, Reply{});
            return;
        case MessageType::RESP_ERR:
        {
            Reply reply;
            reply.error = ErrorCode::Internal;
            if (auto p = ipc::decode_resp_err(msg.payload))
            {
                reply.error   = p->code;
                reply.message = p->message;
            }
            if (req == hello_request_ && !handshake_done_)
            {
                TESSERA_LOG_ERROR("ipc", "Handshake rejected: {}", reply.message);
                pending_.erase(req);
                return;
            }
            resolve(req, std::move(reply));
            return;
        }
        case MessageType::RESP_CREATE_TAB:
        {
            Reply reply;
            if (auto p = ipc::decode_resp_create_tab(msg.payload))
                reply.tab_id = p->tab_id;
            else
                reply.error = ErrorCode::Internal;
            resolve(req, std::move(reply));
            return;
        }
        case MessageType::RESP_SNAPSHOT:
        {
            Reply reply;
            if (auto p = ipc::decode_resp_snapshot(msg.payload))
                reply.image = std::move(p->image);
            else
                reply.error = ErrorCode::Internal;
            resolve(req, std::move(reply));
            return;
        }
        case MessageType::EVT_STATE_CHANGED:
        {
            auto p = ipc::decode_evt_state_changed(msg.payload);
            if (!p)
            {
                TESSERA_LOG_WARN("ipc", "Dropping malformed state-changed event");
                return;
            }
            if (on_state_)
                on_state_(p->window_id, p->state);
            return;
        }
        case MessageType::EVT_SURFACE_CRASHED:
        {
            auto p = ipc::decode_evt_surface_crashed(msg.payload);
            if (p && on_crash_)
                on_crash_(p->window_id, p->tab_id);
            return;
        }
        case MessageType::EVT_WINDOW_CLOSED:
        {
            auto p = ipc::decode_evt_window(msg.payload);
            if (p && on_window_closed_)
                on_window_closed_(p->window_id);
            return;
        }
        case MessageType::EVT_VIEW_FOCUSED:
        {
            auto p = ipc::decode_evt_window(msg.payload);
            if (p && on_focus_)
                on_focus_(p->window_id);
            return;
        }
        case MessageType::EVT_HEARTBEAT:
            return;
        default:
            TESSERA_LOG_WARN("ipc", "Unexpected message {}", ipc::to_string(msg.header.type));
            return;
    }
}

void ViewClient::resolve(ipc::RequestId request_id, Reply reply)
{
    auto it = pending_.find(request_id);
    if (it == pending_.end())
    {
        // Already timed out.
        TESSERA_LOG_DEBUG("ipc", "Late reply for request {}", request_id);
        return;
    }
    // Erase before calling out: the handler may issue new requests.
    Pending pending = std::move(it->second);
    pending_.erase(it);

    if (!reply.ok())
    {
        TESSERA_LOG_DEBUG("ipc", "{} for window {} failed: {} {}", ipc::to_string(pending.type),
                          pending.window_id, ipc::to_string(reply.error), reply.message);
    }
    if (pending.done)
        pending.done(reply);
}

void ViewClient::fail_all(ErrorCode code)
{
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, p] : pending)
    {
        if (p.done)
        {
            Reply reply;
            reply.error   = code;
            reply.message = ipc::to_string(code);
            p.done(reply);
        }
    }
}

void ViewClient::on_disconnected()
{
    disconnected_   = true;
    handshake_done_ = false;
    TESSERA_LOG_WARN("ipc", "View process channel closed, failing {} pending requests",
                     pending_.size());
    fail_all(ErrorCode::Disconnected);
    if (on_disconnect_)
        on_disconnect_();
}

// ─── Timeouts and heartbeat ──────────────────────────────────────────────────

void ViewClient::tick(Clock::time_point now)
{
    std::vector<std::pair<ipc::RequestId, Pending>> expired;
    for (auto it = pending_.begin(); it != pending_.end();)
    {
        auto& p = it->second;
        if (!p.deadline)
        {
            p.deadline = now + request_timeout_;
            ++it;
        }
        else if (now >= *p.deadline)
        {
            expired.emplace_back(it->first, std::move(p));
            it = pending_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (auto& [id, p] : expired)
    {
        TESSERA_LOG_WARN("ipc", "{} for window {} timed out (request {})", ipc::to_string(p.type),
                         p.window_id, id);
        if (p.done)
        {
            Reply reply;
            reply.error   = ErrorCode::Timeout;
            reply.message = "timed out";
            p.done(reply);
        }
    }

    if (handshake_done_ && !disconnected_ && now - last_heartbeat_sent_ >= heartbeat_interval_)
    {
        last_heartbeat_sent_ = now;
        send(MessageType::EVT_HEARTBEAT, INVALID_WINDOW_ID, ipc::INVALID_REQUEST, {});
    }
}

}   // namespace tessera::ui
