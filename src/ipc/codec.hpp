#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace tessera::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────
// Encodes/decodes the fixed 40-byte message header.

// Encode header into exactly HEADER_SIZE bytes (appended to `out`).
void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out);

// Decode header from exactly HEADER_SIZE bytes.
// Returns std::nullopt if magic bytes are wrong or buffer too small.
std::optional<MessageHeader> decode_header(std::span<const uint8_t> data);

// ─── Full message serialization ──────────────────────────────────────────────

// Encode a complete message (header + payload) into a byte buffer.
std::vector<uint8_t> encode_message(const Message& msg);

// Decode a complete message from a byte buffer.
// Returns std::nullopt on any framing/size error.
std::optional<Message> decode_message(std::span<const uint8_t> data);

// ─── Payload serialization (simple TLV-style binary) ─────────────────────────
// Format for each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]
// Nested records (tabs, restack entries) are a TLV buffer stored as the
// value of a single field.

class PayloadEncoder
{
   public:
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_string(uint8_t tag, const std::string& val);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields.
    bool next();

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    // Read the current field's value (caller must check tag first).
    uint16_t    as_u16() const;
    uint32_t    as_u32() const;
    uint64_t    as_u64() const;
    std::string as_string() const;

    // The current field's raw bytes, valid as long as the source buffer.
    std::span<const uint8_t> as_bytes() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
};

void payload_put_bool(PayloadEncoder& enc, uint8_t tag, bool val);
void payload_put_i32(PayloadEncoder& enc, uint8_t tag, int32_t val);
void payload_put_blob(PayloadEncoder& enc, uint8_t tag, const std::vector<uint8_t>& blob);

bool    payload_as_bool(const PayloadDecoder& dec);
int32_t payload_as_i32(const PayloadDecoder& dec);

// ─── Field tags ──────────────────────────────────────────────────────────────

// Handshake
static constexpr uint8_t TAG_PROTOCOL_MAJOR = 0x10;
static constexpr uint8_t TAG_PROTOCOL_MINOR = 0x11;
static constexpr uint8_t TAG_CLIENT_BUILD   = 0x12;
static constexpr uint8_t TAG_SESSION_ID     = 0x20;
static constexpr uint8_t TAG_PROCESS_ID     = 0x22;
static constexpr uint8_t TAG_HEARTBEAT_MS   = 0x23;

// Responses
static constexpr uint8_t TAG_REQUEST_ID    = 0x30;
static constexpr uint8_t TAG_ERROR_CODE    = 0x31;
static constexpr uint8_t TAG_ERROR_MESSAGE = 0x32;
static constexpr uint8_t TAG_IMAGE_NAME    = 0x33;
static constexpr uint8_t TAG_IMAGE_WIDTH   = 0x34;
static constexpr uint8_t TAG_IMAGE_HEIGHT  = 0x35;

// Window / tab addressing
static constexpr uint8_t TAG_WINDOW_ID     = 0x40;
static constexpr uint8_t TAG_TAB_ID        = 0x41;
static constexpr uint8_t TAG_ACTIVE_TAB_ID = 0x42;
static constexpr uint8_t TAG_GROUP_TITLE   = 0x43;

// Geometry and visibility
static constexpr uint8_t TAG_X            = 0x50;
static constexpr uint8_t TAG_Y            = 0x51;
static constexpr uint8_t TAG_WIDTH        = 0x52;
static constexpr uint8_t TAG_HEIGHT       = 0x53;
static constexpr uint8_t TAG_IS_VISIBLE   = 0x54;
static constexpr uint8_t TAG_IS_FOCUSED   = 0x55;
static constexpr uint8_t TAG_IS_FROZEN    = 0x56;
static constexpr uint8_t TAG_IS_MINIMIZED = 0x57;
static constexpr uint8_t TAG_RESTACK_BLOB = 0x58;   // nested TLV per window

// Navigation
static constexpr uint8_t TAG_URL     = 0x60;
static constexpr uint8_t TAG_NAV_SEQ = 0x61;
static constexpr uint8_t TAG_ACTION  = 0x62;   // "back" | "forward" | "reload" | "stop"

// Tab record (nested TLV inside TAG_TAB_BLOB)
static constexpr uint8_t TAG_TAB_BLOB       = 0x70;
static constexpr uint8_t TAG_TITLE          = 0x71;
static constexpr uint8_t TAG_FAVICON_URL    = 0x72;
static constexpr uint8_t TAG_IS_LOADING     = 0x73;
static constexpr uint8_t TAG_CAN_GO_BACK    = 0x74;
static constexpr uint8_t TAG_CAN_GO_FORWARD = 0x75;
static constexpr uint8_t TAG_ERROR_TEXT     = 0x76;

// ─── Handshake / response payloads ───────────────────────────────────────────

std::vector<uint8_t>        encode_hello(const HelloPayload& p);
std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_welcome(const WelcomePayload& p);
std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_resp_ok(const RespOkPayload& p);
std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_resp_err(const RespErrPayload& p);
std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_resp_create_tab(const RespCreateTabPayload& p);
std::optional<RespCreateTabPayload> decode_resp_create_tab(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_resp_snapshot(const RespSnapshotPayload& p);
std::optional<RespSnapshotPayload> decode_resp_snapshot(std::span<const uint8_t> data);

// ─── Request payloads ────────────────────────────────────────────────────────
// Decoders reject a missing window id, negative extents and unknown
// navigation actions.

std::vector<uint8_t>                encode_req_create_view(const ReqCreateViewPayload& p);
std::optional<ReqCreateViewPayload> decode_req_create_view(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_req_create_tab(const ReqCreateTabPayload& p);
std::optional<ReqCreateTabPayload> decode_req_create_tab(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_req_tab(const ReqTabPayload& p);
std::optional<ReqTabPayload> decode_req_tab(std::span<const uint8_t> data);

std::vector<uint8_t>             encode_req_load_url(const ReqLoadUrlPayload& p);
std::optional<ReqLoadUrlPayload> decode_req_load_url(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_req_navigate(const ReqNavigatePayload& p);
std::optional<ReqNavigatePayload> decode_req_navigate(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_req_set_bounds(const ReqSetBoundsPayload& p);
std::optional<ReqSetBoundsPayload> decode_req_set_bounds(std::span<const uint8_t> data);

std::vector<uint8_t>                   encode_req_set_visibility(const ReqSetVisibilityPayload& p);
std::optional<ReqSetVisibilityPayload> decode_req_set_visibility(std::span<const uint8_t> data);

std::vector<uint8_t>            encode_req_window(const ReqWindowPayload& p);
std::optional<ReqWindowPayload> decode_req_window(std::span<const uint8_t> data);

std::vector<uint8_t> encode_req_restack_windows(const ReqRestackWindowsPayload& p);
std::optional<ReqRestackWindowsPayload> decode_req_restack_windows(std::span<const uint8_t> data);

// ─── Event payloads ──────────────────────────────────────────────────────────

std::vector<uint8_t>                  encode_evt_state_changed(const EvtStateChangedPayload& p);
std::optional<EvtStateChangedPayload> decode_evt_state_changed(std::span<const uint8_t> data);

std::vector<uint8_t> encode_evt_surface_crashed(const EvtSurfaceCrashedPayload& p);
std::optional<EvtSurfaceCrashedPayload> decode_evt_surface_crashed(std::span<const uint8_t> data);

std::vector<uint8_t>            encode_evt_window(const EvtWindowPayload& p);
std::optional<EvtWindowPayload> decode_evt_window(std::span<const uint8_t> data);

}   // namespace tessera::ipc
