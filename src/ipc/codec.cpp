#include "codec.hpp"

#include <cstring>

namespace tessera::ipc
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

static void write_u16_le(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& buf, uint32_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static void write_u64_le(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32_le(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
           | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

// ─── Names ───────────────────────────────────────────────────────────────────

const char* to_string(MessageType type)
{
    switch (type)
    {
        case MessageType::HELLO:
            return "HELLO";
        case MessageType::WELCOME:
            return "WELCOME";
        case MessageType::RESP_OK:
            return "RESP_OK";
        case MessageType::RESP_ERR:
            return "RESP_ERR";
        case MessageType::RESP_CREATE_TAB:
            return "RESP_CREATE_TAB";
        case MessageType::RESP_SNAPSHOT:
            return "RESP_SNAPSHOT";
        case MessageType::REQ_CREATE_VIEW:
            return "REQ_CREATE_VIEW";
        case MessageType::REQ_CREATE_TAB:
            return "REQ_CREATE_TAB";
        case MessageType::REQ_SWITCH_TAB:
            return "REQ_SWITCH_TAB";
        case MessageType::REQ_CLOSE_TAB:
            return "REQ_CLOSE_TAB";
        case MessageType::REQ_LOAD_URL:
            return "REQ_LOAD_URL";
        case MessageType::REQ_NAVIGATE:
            return "REQ_NAVIGATE";
        case MessageType::REQ_SET_BOUNDS:
            return "REQ_SET_BOUNDS";
        case MessageType::REQ_SET_VISIBILITY:
            return "REQ_SET_VISIBILITY";
        case MessageType::REQ_DESTROY_VIEW:
            return "REQ_DESTROY_VIEW";
        case MessageType::REQ_CAPTURE_SNAPSHOT:
            return "REQ_CAPTURE_SNAPSHOT";
        case MessageType::REQ_SHOW_AND_FOCUS:
            return "REQ_SHOW_AND_FOCUS";
        case MessageType::REQ_RESTACK_WINDOWS:
            return "REQ_RESTACK_WINDOWS";
        case MessageType::EVT_STATE_CHANGED:
            return "EVT_STATE_CHANGED";
        case MessageType::EVT_SURFACE_CRASHED:
            return "EVT_SURFACE_CRASHED";
        case MessageType::EVT_WINDOW_CLOSED:
            return "EVT_WINDOW_CLOSED";
        case MessageType::EVT_VIEW_FOCUSED:
            return "EVT_VIEW_FOCUSED";
        case MessageType::EVT_HEARTBEAT:
            return "EVT_HEARTBEAT";
    }
    return "UNKNOWN";
}

const char* to_string(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalid-argument";
        case ErrorCode::UnknownWindow:
            return "unknown-window";
        case ErrorCode::UnknownTab:
            return "unknown-tab";
        case ErrorCode::InvalidUrl:
            return "invalid-url";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::Disconnected:
            return "disconnected";
        case ErrorCode::Internal:
            return "internal";
    }
    return "unknown";
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    write_u16_le(out, static_cast<uint16_t>(hdr.type));
    write_u32_le(out, hdr.payload_len);
    write_u64_le(out, hdr.seq);
    write_u64_le(out, hdr.request_id);
    write_u64_le(out, hdr.session_id);
    write_u64_le(out, hdr.window_id);
}

std::optional<MessageHeader> decode_header(std::span<const uint8_t> data)
{
    if (data.size() < HEADER_SIZE)
        return std::nullopt;
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1)
        return std::nullopt;

    MessageHeader hdr;
    hdr.type        = static_cast<MessageType>(read_u16_le(&data[2]));
    hdr.payload_len = read_u32_le(&data[4]);
    hdr.seq         = read_u64_le(&data[8]);
    hdr.request_id  = read_u64_le(&data[16]);
    hdr.session_id  = read_u64_le(&data[24]);
    hdr.window_id   = read_u64_le(&data[32]);
    return hdr;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    MessageHeader        hdr = msg.header;
    hdr.payload_len          = static_cast<uint32_t>(msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    auto hdr_opt = decode_header(data);
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;
    if (data.size() < HEADER_SIZE + hdr.payload_len)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.assign(data.begin() + HEADER_SIZE, data.begin() + HEADER_SIZE + hdr.payload_len);
    return msg;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

void PayloadEncoder::put_u16(uint8_t tag, uint16_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 2);
    write_u16_le(buf_, val);
}

void PayloadEncoder::put_u32(uint8_t tag, uint32_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 4);
    write_u32_le(buf_, val);
}

void PayloadEncoder::put_u64(uint8_t tag, uint64_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 8);
    write_u64_le(buf_, val);
}

void PayloadEncoder::put_string(uint8_t tag, const std::string& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data) : data_(data) {}

bool PayloadDecoder::next()
{
    // Need at least 1 (tag) + 4 (len) bytes
    if (pos_ + 5 > data_.size())
        return false;

    tag_        = data_[pos_];
    len_        = read_u32_le(data_.data() + pos_ + 1);
    val_offset_ = pos_ + 5;

    if (val_offset_ + len_ > data_.size())
        return false;

    pos_ = val_offset_ + len_;
    return true;
}

uint16_t PayloadDecoder::as_u16() const
{
    if (len_ < 2)
        return 0;
    return read_u16_le(data_.data() + val_offset_);
}

uint32_t PayloadDecoder::as_u32() const
{
    if (len_ < 4)
        return 0;
    return read_u32_le(data_.data() + val_offset_);
}

uint64_t PayloadDecoder::as_u64() const
{
    if (len_ < 8)
        return 0;
    return read_u64_le(data_.data() + val_offset_);
}

std::string PayloadDecoder::as_string() const
{
    return std::string(reinterpret_cast<const char*>(data_.data() + val_offset_), len_);
}

std::span<const uint8_t> PayloadDecoder::as_bytes() const
{
    return data_.subspan(val_offset_, len_);
}

void payload_put_bool(PayloadEncoder& enc, uint8_t tag, bool val)
{
    enc.put_u16(tag, val ? 1 : 0);
}

void payload_put_i32(PayloadEncoder& enc, uint8_t tag, int32_t val)
{
    uint32_t bits;
    std::memcpy(&bits, &val, 4);
    enc.put_u32(tag, bits);
}

void payload_put_blob(PayloadEncoder& enc, uint8_t tag, const std::vector<uint8_t>& blob)
{
    enc.put_string(tag, std::string(reinterpret_cast<const char*>(blob.data()), blob.size()));
}

bool payload_as_bool(const PayloadDecoder& dec)
{
    return dec.as_u16() != 0;
}

int32_t payload_as_i32(const PayloadDecoder& dec)
{
    uint32_t bits = dec.as_u32();
    int32_t  val;
    std::memcpy(&val, &bits, 4);
    return val;
}

// ─── Handshake payload encode/decode ─────────────────────────────────────────

std::vector<uint8_t> encode_hello(const HelloPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROTOCOL_MAJOR, p.protocol_major);
    enc.put_u16(TAG_PROTOCOL_MINOR, p.protocol_minor);
    enc.put_string(TAG_CLIENT_BUILD, p.client_build);
    return enc.take();
}

std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data)
{
    HelloPayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_PROTOCOL_MAJOR: p.protocol_major = dec.as_u16(); break;
            case TAG_PROTOCOL_MINOR: p.protocol_minor = dec.as_u16(); break;
            case TAG_CLIENT_BUILD:   p.client_build   = dec.as_string(); break;
            default: break;   // skip unknown tags (forward compat)
        }
    }
    return p;
}

std::vector<uint8_t> encode_welcome(const WelcomePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SESSION_ID, p.session_id);
    enc.put_u64(TAG_PROCESS_ID, p.process_id);
    enc.put_u32(TAG_HEARTBEAT_MS, p.heartbeat_ms);
    return enc.take();
}

std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data)
{
    WelcomePayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION_ID:   p.session_id   = dec.as_u64(); break;
            case TAG_PROCESS_ID:   p.process_id   = dec.as_u64(); break;
            case TAG_HEARTBEAT_MS: p.heartbeat_ms = dec.as_u32(); break;
            default: break;
        }
    }
    return p;
}

// ─── Response payload encode/decode ──────────────────────────────────────────

std::vector<uint8_t> encode_resp_ok(const RespOkPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    return enc.take();
}

std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data)
{
    RespOkPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_REQUEST_ID)
            p.request_id = dec.as_u64();
    }
    return p;
}

std::vector<uint8_t> encode_resp_err(const RespErrPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    enc.put_u32(TAG_ERROR_CODE, static_cast<uint32_t>(p.code));
    enc.put_string(TAG_ERROR_MESSAGE, p.message);
    return enc.take();
}

std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data)
{
    RespErrPayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID:    p.request_id = dec.as_u64(); break;
            case TAG_ERROR_CODE:    p.code       = static_cast<ErrorCode>(dec.as_u32()); break;
            case TAG_ERROR_MESSAGE: p.message    = dec.as_string(); break;
            default: break;
        }
    }
    return p;
}

std::vector<uint8_t> encode_resp_create_tab(const RespCreateTabPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    enc.put_u64(TAG_TAB_ID, p.tab_id);
    return enc.take();
}

std::optional<RespCreateTabPayload> decode_resp_create_tab(std::span<const uint8_t> data)
{
    RespCreateTabPayload p;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID: p.request_id = dec.as_u64(); break;
            case TAG_TAB_ID:     p.tab_id     = dec.as_u64(); break;
            default: break;
        }
    }
    if (p.tab_id == INVALID_TAB_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_resp_snapshot(const RespSnapshotPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    if (p.image)
    {
        enc.put_string(TAG_IMAGE_NAME, p.image->name);
        enc.put_u32(TAG_IMAGE_WIDTH, p.image->width);
        enc.put_u32(TAG_IMAGE_HEIGHT, p.image->height);
    }
    return enc.take();
}

std::optional<RespSnapshotPayload> decode_resp_snapshot(std::span<const uint8_t> data)
{
    RespSnapshotPayload p;
    ImageRef            image;
    bool                has_image = false;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID:
                p.request_id = dec.as_u64();
                break;
            case TAG_IMAGE_NAME:
                image.name = dec.as_string();
                has_image  = true;
                break;
            case TAG_IMAGE_WIDTH:
                image.width = dec.as_u32();
                break;
            case TAG_IMAGE_HEIGHT:
                image.height = dec.as_u32();
                break;
            default:
                break;
        }
    }
    if (has_image)
        p.image = std::move(image);
    return p;
}

// ─── Request payload encode/decode ───────────────────────────────────────────

static void put_rect(PayloadEncoder& enc, const Rect& r)
{
    payload_put_i32(enc, TAG_X, r.x);
    payload_put_i32(enc, TAG_Y, r.y);
    payload_put_i32(enc, TAG_WIDTH, r.width);
    payload_put_i32(enc, TAG_HEIGHT, r.height);
}

// Returns true if the current field was a rect component.
static bool read_rect_field(const PayloadDecoder& dec, Rect& r)
{
    switch (dec.tag())
    {
        case TAG_X:      r.x      = payload_as_i32(dec); return true;
        case TAG_Y:      r.y      = payload_as_i32(dec); return true;
        case TAG_WIDTH:  r.width  = payload_as_i32(dec); return true;
        case TAG_HEIGHT: r.height = payload_as_i32(dec); return true;
        default: return false;
    }
}

static bool rect_is_valid(const Rect& r)
{
    return r.width >= 0 && r.height >= 0;
}

std::vector<uint8_t> encode_req_create_view(const ReqCreateViewPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    put_rect(enc, p.bounds);
    enc.put_string(TAG_URL, p.initial_url);
    return enc.take();
}

std::optional<ReqCreateViewPayload> decode_req_create_view(std::span<const uint8_t> data)
{
    ReqCreateViewPayload p;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        if (read_rect_field(dec, p.bounds))
            continue;
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id   = dec.as_u64(); break;
            case TAG_URL:       p.initial_url = dec.as_string(); break;
            default: break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID || !rect_is_valid(p.bounds))
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_create_tab(const ReqCreateTabPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    if (p.url)
        enc.put_string(TAG_URL, *p.url);
    return enc.take();
}

std::optional<ReqCreateTabPayload> decode_req_create_tab(std::span<const uint8_t> data)
{
    ReqCreateTabPayload p;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id = dec.as_u64(); break;
            case TAG_URL:       p.url       = dec.as_string(); break;
            default: break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_tab(const ReqTabPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_u64(TAG_TAB_ID, p.tab_id);
    return enc.take();
}

std::optional<ReqTabPayload> decode_req_tab(std::span<const uint8_t> data)
{
    ReqTabPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id = dec.as_u64(); break;
            case TAG_TAB_ID:    p.tab_id    = dec.as_u64(); break;
            default: break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID || p.tab_id == INVALID_TAB_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_load_url(const ReqLoadUrlPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_string(TAG_URL, p.url);
    enc.put_u64(TAG_NAV_SEQ, p.nav_seq);
    return enc.take();
}

std::optional<ReqLoadUrlPayload> decode_req_load_url(std::span<const uint8_t> data)
{
    ReqLoadUrlPayload p;
    PayloadDecoder    dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id = dec.as_u64(); break;
            case TAG_URL:       p.url       = dec.as_string(); break;
            case TAG_NAV_SEQ:   p.nav_seq   = dec.as_u64(); break;
            default: break;
        }
    }
    // An empty URL is answered with InvalidUrl by the service, not dropped here.
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_navigate(const ReqNavigatePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_string(TAG_ACTION, to_string(p.action));
    return enc.take();
}

std::optional<ReqNavigatePayload> decode_req_navigate(std::span<const uint8_t> data)
{
    ReqNavigatePayload              p;
    std::optional<NavigationAction> action;
    PayloadDecoder                  dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id = dec.as_u64(); break;
            case TAG_ACTION:    action      = parse_navigation_action(dec.as_string()); break;
            default: break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID || !action)
        return std::nullopt;
    p.action = *action;
    return p;
}

std::vector<uint8_t> encode_req_set_bounds(const ReqSetBoundsPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    put_rect(enc, p.bounds);
    return enc.take();
}

std::optional<ReqSetBoundsPayload> decode_req_set_bounds(std::span<const uint8_t> data)
{
    ReqSetBoundsPayload p;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        if (read_rect_field(dec, p.bounds))
            continue;
        if (dec.tag() == TAG_WINDOW_ID)
            p.window_id = dec.as_u64();
    }
    if (p.window_id == INVALID_WINDOW_ID || !rect_is_valid(p.bounds))
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_set_visibility(const ReqSetVisibilityPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    payload_put_bool(enc, TAG_IS_VISIBLE, p.is_visible);
    payload_put_bool(enc, TAG_IS_FOCUSED, p.is_focused);
    return enc.take();
}

std::optional<ReqSetVisibilityPayload> decode_req_set_visibility(std::span<const uint8_t> data)
{
    ReqSetVisibilityPayload p;
    PayloadDecoder          dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID:  p.window_id  = dec.as_u64(); break;
            case TAG_IS_VISIBLE: p.is_visible = payload_as_bool(dec); break;
            case TAG_IS_FOCUSED: p.is_focused = payload_as_bool(dec); break;
            default: break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_window(const ReqWindowPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    return enc.take();
}

std::optional<ReqWindowPayload> decode_req_window(std::span<const uint8_t> data)
{
    ReqWindowPayload p;
    PayloadDecoder   dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_WINDOW_ID)
            p.window_id = dec.as_u64();
    }
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_restack_windows(const ReqRestackWindowsPayload& p)
{
    PayloadEncoder enc;
    for (const auto& w : p.windows)
    {
        PayloadEncoder entry;
        entry.put_u64(TAG_WINDOW_ID, w.window_id);
        payload_put_bool(entry, TAG_IS_FROZEN, w.is_frozen);
        payload_put_bool(entry, TAG_IS_MINIMIZED, w.is_minimized);
        payload_put_blob(enc, TAG_RESTACK_BLOB, entry.data());
    }
    return enc.take();
}

std::optional<ReqRestackWindowsPayload> decode_req_restack_windows(std::span<const uint8_t> data)
{
    ReqRestackWindowsPayload p;
    PayloadDecoder           dec(data);
    while (dec.next())
    {
        if (dec.tag() != TAG_RESTACK_BLOB)
            continue;

        RestackEntry   w;
        PayloadDecoder entry(dec.as_bytes());
        while (entry.next())
        {
            switch (entry.tag())
            {
                case TAG_WINDOW_ID:    w.window_id    = entry.as_u64(); break;
                case TAG_IS_FROZEN:    w.is_frozen    = payload_as_bool(entry); break;
                case TAG_IS_MINIMIZED: w.is_minimized = payload_as_bool(entry); break;
                default: break;
            }
        }
        if (w.window_id == INVALID_WINDOW_ID)
            return std::nullopt;
        p.windows.push_back(w);
    }
    return p;
}

// ─── Event payload encode/decode ─────────────────────────────────────────────

static std::vector<uint8_t> encode_tab(const TabState& t)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_TAB_ID, t.id);
    enc.put_string(TAG_URL, t.url);
    enc.put_string(TAG_TITLE, t.title);
    if (t.favicon_url)
        enc.put_string(TAG_FAVICON_URL, *t.favicon_url);
    payload_put_bool(enc, TAG_IS_LOADING, t.is_loading);
    payload_put_bool(enc, TAG_CAN_GO_BACK, t.can_go_back);
    payload_put_bool(enc, TAG_CAN_GO_FORWARD, t.can_go_forward);
    if (t.error)
        enc.put_string(TAG_ERROR_TEXT, *t.error);
    enc.put_u64(TAG_NAV_SEQ, t.nav_seq);
    return enc.take();
}

static std::optional<TabState> decode_tab(std::span<const uint8_t> data)
{
    TabState       t;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_TAB_ID:         t.id             = dec.as_u64(); break;
            case TAG_URL:            t.url            = dec.as_string(); break;
            case TAG_TITLE:          t.title          = dec.as_string(); break;
            case TAG_FAVICON_URL:    t.favicon_url    = dec.as_string(); break;
            case TAG_IS_LOADING:     t.is_loading     = payload_as_bool(dec); break;
            case TAG_CAN_GO_BACK:    t.can_go_back    = payload_as_bool(dec); break;
            case TAG_CAN_GO_FORWARD: t.can_go_forward = payload_as_bool(dec); break;
            case TAG_ERROR_TEXT:     t.error          = dec.as_string(); break;
            case TAG_NAV_SEQ:        t.nav_seq        = dec.as_u64(); break;
            default: break;
        }
    }
    if (t.id == INVALID_TAB_ID)
        return std::nullopt;
    return t;
}

std::vector<uint8_t> encode_evt_state_changed(const EvtStateChangedPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_u64(TAG_ACTIVE_TAB_ID, p.state.active_tab_id);
    if (p.state.tab_group_title)
        enc.put_string(TAG_GROUP_TITLE, *p.state.tab_group_title);
    for (const auto& tab : p.state.tabs)
        payload_put_blob(enc, TAG_TAB_BLOB, encode_tab(tab));
    return enc.take();
}

std::optional<EvtStateChangedPayload> decode_evt_state_changed(std::span<const uint8_t> data)
{
    EvtStateChangedPayload p;
    PayloadDecoder         dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID:
                p.window_id = dec.as_u64();
                break;
            case TAG_ACTIVE_TAB_ID:
                p.state.active_tab_id = dec.as_u64();
                break;
            case TAG_GROUP_TITLE:
                p.state.tab_group_title = dec.as_string();
                break;
            case TAG_TAB_BLOB:
            {
                auto tab = decode_tab(dec.as_bytes());
                if (!tab)
                    return std::nullopt;
                p.state.tabs.push_back(std::move(*tab));
                break;
            }
            default:
                break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_evt_surface_crashed(const EvtSurfaceCrashedPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_u64(TAG_TAB_ID, p.tab_id);
    return enc.take();
}

std::optional<EvtSurfaceCrashedPayload> decode_evt_surface_crashed(std::span<const uint8_t> data)
{
    EvtSurfaceCrashedPayload p;
    PayloadDecoder           dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_WINDOW_ID: p.window_id = dec.as_u64(); break;
            case TAG_TAB_ID:    p.tab_id    = dec.as_u64(); break;
            default: break;
        }
    }
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_evt_window(const EvtWindowPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    return enc.take();
}

std::optional<EvtWindowPayload> decode_evt_window(std::span<const uint8_t> data)
{
    EvtWindowPayload p;
    PayloadDecoder   dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_WINDOW_ID)
            p.window_id = dec.as_u64();
    }
    if (p.window_id == INVALID_WINDOW_ID)
        return std::nullopt;
    return p;
}

}   // namespace tessera::ipc
