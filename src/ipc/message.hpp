#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>
#include <tessera/tab_state.hpp>
#include <vector>

namespace tessera::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using SessionId = uint64_t;
using ProcessId = uint64_t;
using RequestId = uint64_t;

static constexpr SessionId INVALID_SESSION = 0;
static constexpr RequestId INVALID_REQUEST = 0;

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Handshake
    HELLO   = 0x0001,
    WELCOME = 0x0002,

    // Responses (view → UI)
    RESP_OK         = 0x0010,
    RESP_ERR        = 0x0011,
    RESP_CREATE_TAB = 0x0012,
    RESP_SNAPSHOT   = 0x0013,

    // Requests (UI → view)
    REQ_CREATE_VIEW      = 0x0100,
    REQ_CREATE_TAB       = 0x0101,
    REQ_SWITCH_TAB       = 0x0102,
    REQ_CLOSE_TAB        = 0x0103,
    REQ_LOAD_URL         = 0x0104,
    REQ_NAVIGATE         = 0x0105,
    REQ_SET_BOUNDS       = 0x0106,
    REQ_SET_VISIBILITY   = 0x0107,
    REQ_DESTROY_VIEW     = 0x0108,
    REQ_CAPTURE_SNAPSHOT = 0x0109,
    REQ_SHOW_AND_FOCUS   = 0x010A,
    REQ_RESTACK_WINDOWS  = 0x010B,

    // Events (view → UI, request_id 0)
    EVT_STATE_CHANGED   = 0x0400,
    EVT_SURFACE_CRASHED = 0x0401,
    EVT_WINDOW_CLOSED   = 0x0402,
    EVT_VIEW_FOCUSED    = 0x0403,
    EVT_HEARTBEAT       = 0x0404,
};

const char* to_string(MessageType type);

// ─── Error codes ─────────────────────────────────────────────────────────────
enum class ErrorCode : uint32_t
{
    None            = 0,
    InvalidArgument = 1,
    UnknownWindow   = 2,
    UnknownTab      = 3,
    InvalidUrl      = 4,
    Timeout         = 5,
    Disconnected    = 6,
    Internal        = 7,
};

const char* to_string(ErrorCode code);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 40 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x54, 0x53 = "TS")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-23: request_id (uint64_t LE)
//   bytes 24-31: session_id (uint64_t LE)
//   bytes 32-39: window_id (uint64_t LE)

static constexpr uint8_t MAGIC_0          = 0x54;   // 'T'
static constexpr uint8_t MAGIC_1          = 0x53;   // 'S'
static constexpr size_t  HEADER_SIZE      = 40;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;   // 16 MiB

struct MessageHeader
{
    MessageType type        = MessageType::HELLO;
    uint32_t    payload_len = 0;
    uint64_t    seq         = 0;
    RequestId   request_id  = INVALID_REQUEST;
    SessionId   session_id  = INVALID_SESSION;
    WindowId    window_id   = INVALID_WINDOW_ID;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Handshake payloads ──────────────────────────────────────────────────────

static constexpr uint16_t PROTOCOL_MAJOR = 1;
static constexpr uint16_t PROTOCOL_MINOR = 0;

struct HelloPayload
{
    uint16_t    protocol_major = PROTOCOL_MAJOR;
    uint16_t    protocol_minor = PROTOCOL_MINOR;
    std::string client_build;
};

struct WelcomePayload
{
    SessionId session_id   = INVALID_SESSION;
    ProcessId process_id   = 0;
    uint32_t  heartbeat_ms = 5000;
};

// ─── Response payloads ───────────────────────────────────────────────────────

struct RespOkPayload
{
    RequestId request_id = INVALID_REQUEST;
};

struct RespErrPayload
{
    RequestId   request_id = INVALID_REQUEST;
    ErrorCode   code       = ErrorCode::Internal;
    std::string message;
};

struct RespCreateTabPayload
{
    RequestId request_id = INVALID_REQUEST;
    TabId     tab_id     = INVALID_TAB_ID;
};

// `image` is empty when nothing was captured (auth page, no surface,
// capture failure).
struct RespSnapshotPayload
{
    RequestId               request_id = INVALID_REQUEST;
    std::optional<ImageRef> image;
};

// ─── Request payloads ────────────────────────────────────────────────────────
// Every request names its window; a zero window id fails to decode.

struct ReqCreateViewPayload
{
    WindowId    window_id = INVALID_WINDOW_ID;
    Rect        bounds;
    std::string initial_url;   // empty: default new-tab URL
};

struct ReqCreateTabPayload
{
    WindowId                   window_id = INVALID_WINDOW_ID;
    std::optional<std::string> url;
};

// Shared by switch-tab and close-tab.
struct ReqTabPayload
{
    WindowId window_id = INVALID_WINDOW_ID;
    TabId    tab_id    = INVALID_TAB_ID;
};

struct ReqLoadUrlPayload
{
    WindowId    window_id = INVALID_WINDOW_ID;
    std::string url;
    NavSeq      nav_seq = 0;
};

struct ReqNavigatePayload
{
    WindowId         window_id = INVALID_WINDOW_ID;
    NavigationAction action    = NavigationAction::Reload;
};

struct ReqSetBoundsPayload
{
    WindowId window_id = INVALID_WINDOW_ID;
    Rect     bounds;
};

struct ReqSetVisibilityPayload
{
    WindowId window_id  = INVALID_WINDOW_ID;
    bool     is_visible = true;
    bool     is_focused = false;
};

// Shared by destroy-view, capture-snapshot and show-and-focus.
struct ReqWindowPayload
{
    WindowId window_id = INVALID_WINDOW_ID;
};

struct RestackEntry
{
    WindowId window_id    = INVALID_WINDOW_ID;
    bool     is_frozen    = false;
    bool     is_minimized = false;

    bool operator==(const RestackEntry&) const = default;
};

// Ascending z-order: the last entry ends up topmost.
struct ReqRestackWindowsPayload
{
    std::vector<RestackEntry> windows;
};

// ─── Event payloads ──────────────────────────────────────────────────────────

struct EvtStateChangedPayload
{
    WindowId     window_id = INVALID_WINDOW_ID;
    BrowserState state;
};

struct EvtSurfaceCrashedPayload
{
    WindowId window_id = INVALID_WINDOW_ID;
    TabId    tab_id    = INVALID_TAB_ID;
};

// Shared by window-closed and view-focused.
struct EvtWindowPayload
{
    WindowId window_id = INVALID_WINDOW_ID;
};

}   // namespace tessera::ipc
