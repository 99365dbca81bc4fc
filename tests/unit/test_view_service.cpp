#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <vector>

#include "core/config.hpp"
#include "ipc/blob_store.hpp"
#include "ipc/codec.hpp"
#include "ipc/port.hpp"
#include "view/headless_surface_host.hpp"
#include "view/view_service.hpp"

using namespace tessera;
using namespace tessera::ipc;
using namespace tessera::view;

namespace
{

Config test_config()
{
    Config config;
    config.heartbeat_ms        = 100;
    config.max_snapshots       = 2;
    config.default_new_tab_url = "https://www.are.na";
    return config;
}

class ViewServiceTest : public ::testing::Test
{
   protected:
    ViewServiceTest()
    {
        auto [ui, view] = LoopbackPort::make_pair();
        ui_             = std::move(ui);
        view_           = std::move(view);
        service_.attach(view_.get());
    }

    ~ViewServiceTest() override { service_.attach(nullptr); }

    void send(MessageType type, std::vector<uint8_t> payload, WindowId window = INVALID_WINDOW_ID)
    {
        Message msg;
        msg.header.type        = type;
        msg.header.request_id  = ++next_request_;
        msg.header.window_id   = window;
        msg.payload            = std::move(payload);
        msg.header.payload_len = static_cast<uint32_t>(msg.payload.size());
        ASSERT_TRUE(ui_->send(msg));
        service_.poll();
    }

    std::vector<Message> drain()
    {
        std::vector<Message> out;
        while (auto msg = ui_->poll())
            out.push_back(std::move(*msg));
        return out;
    }

    // Last message of `type` since the previous drain.
    static const Message* find_last(const std::vector<Message>& msgs, MessageType type)
    {
        const Message* found = nullptr;
        for (const auto& m : msgs)
        {
            if (m.header.type == type)
                found = &m;
        }
        return found;
    }

    void handshake()
    {
        HelloPayload hello;
        hello.client_build = "test";
        send(MessageType::HELLO, encode_hello(hello));
        drain();
    }

    void create_view(WindowId window, Rect bounds = {0, 0, 800, 600}, std::string url = {})
    {
        send(MessageType::REQ_CREATE_VIEW, encode_req_create_view({window, bounds, std::move(url)}));
    }

    Config                        config_ = test_config();
    HeadlessSurfaceHost           host_;
    MemoryBlobStore               blobs_;
    ViewService                   service_{host_, blobs_, config_};
    std::unique_ptr<LoopbackPort> ui_;
    std::unique_ptr<LoopbackPort> view_;
    RequestId                     next_request_ = 0;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ViewServiceTest, RequestBeforeHandshakeIsRejected)
{
    create_view(1);
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::RESP_ERR);
    EXPECT_EQ(msgs[0].header.request_id, next_request_);
    auto err = decode_resp_err(msgs[0].payload);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::InvalidArgument);
    EXPECT_EQ(err->message, "handshake required");
    EXPECT_EQ(service_.tabs().window_count(), 0u);
}

TEST_F(ViewServiceTest, HelloGetsWelcome)
{
    HelloPayload hello;
    hello.client_build = "tessera-workspace";
    send(MessageType::HELLO, encode_hello(hello));

    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::WELCOME);
    EXPECT_EQ(msgs[0].header.request_id, next_request_);
    auto welcome = decode_welcome(msgs[0].payload);
    ASSERT_TRUE(welcome.has_value());
    EXPECT_NE(welcome->session_id, INVALID_SESSION);
    EXPECT_EQ(welcome->heartbeat_ms, 100u);
    EXPECT_TRUE(service_.handshake_done());
}

TEST_F(ViewServiceTest, ProtocolMismatchClosesChannel)
{
    HelloPayload hello;
    hello.protocol_major = PROTOCOL_MAJOR + 1;
    send(MessageType::HELLO, encode_hello(hello));

    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::RESP_ERR);
    EXPECT_FALSE(service_.handshake_done());
    EXPECT_FALSE(ui_->is_open());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ViewServiceTest, CreateViewRepliesAndPublishesState)
{
    handshake();
    create_view(4, {10, 20, 640, 480}, "are.na/explore");

    auto msgs = drain();
    const Message* ok = find_last(msgs, MessageType::RESP_OK);
    ASSERT_NE(ok, nullptr);
    EXPECT_EQ(ok->header.request_id, next_request_);

    const Message* evt = find_last(msgs, MessageType::EVT_STATE_CHANGED);
    ASSERT_NE(evt, nullptr);
    EXPECT_EQ(evt->header.request_id, INVALID_REQUEST);
    EXPECT_EQ(evt->header.window_id, 4u);
    auto state = decode_evt_state_changed(evt->payload);
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->state.tabs.size(), 1u);
    EXPECT_EQ(state->state.tabs[0].url, "https://are.na/explore");
    EXPECT_TRUE(state->state.tabs[0].is_loading);
}

TEST_F(ViewServiceTest, NavigationProgressIsPushed)
{
    handshake();
    create_view(1);
    drain();

    host_.pump();
    auto msgs = drain();
    const Message* evt = find_last(msgs, MessageType::EVT_STATE_CHANGED);
    ASSERT_NE(evt, nullptr);
    auto state = decode_evt_state_changed(evt->payload);
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->state.tabs[0].is_loading);
    EXPECT_EQ(state->state.tabs[0].title, "www.are.na");
}

TEST_F(ViewServiceTest, CreateTabRepliesWithTabId)
{
    handshake();
    create_view(1);
    drain();

    send(MessageType::REQ_CREATE_TAB, encode_req_create_tab({1, std::string("https://b")}), 1);
    auto msgs = drain();
    const Message* resp = find_last(msgs, MessageType::RESP_CREATE_TAB);
    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->header.request_id, next_request_);
    auto created = decode_resp_create_tab(resp->payload);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(service_.tabs().state(1)->active_tab_id, created->tab_id);
}

TEST_F(ViewServiceTest, UnknownWindowIsAnError)
{
    handshake();
    send(MessageType::REQ_LOAD_URL, encode_req_load_url({9, "https://a", 1}), 9);
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    auto err = decode_resp_err(msgs[0].payload);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::UnknownWindow);
    EXPECT_EQ(err->request_id, next_request_);
}

TEST_F(ViewServiceTest, MalformedPayloadIsRejected)
{
    handshake();
    send(MessageType::REQ_SET_BOUNDS, {0x01, 0x02});
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::RESP_ERR);
    auto err = decode_resp_err(msgs[0].payload);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::InvalidArgument);
    EXPECT_EQ(err->message, "malformed payload");
}

TEST_F(ViewServiceTest, UnexpectedMessageType)
{
    handshake();
    send(MessageType::RESP_OK, encode_resp_ok({1}));
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::RESP_ERR);
}

TEST_F(ViewServiceTest, EveryRequestGetsOneResponse)
{
    handshake();
    create_view(1);
    send(MessageType::REQ_SET_BOUNDS, encode_req_set_bounds({1, {0, 0, 300, 200}}), 1);
    send(MessageType::REQ_SET_VISIBILITY, encode_req_set_visibility({1, true, true}), 1);
    send(MessageType::REQ_NAVIGATE, encode_req_navigate({1, NavigationAction::Reload}), 1);
    send(MessageType::REQ_SHOW_AND_FOCUS, encode_req_window({1}), 1);
    send(MessageType::REQ_RESTACK_WINDOWS, encode_req_restack_windows({{{1, false, false}}}));

    size_t responses = 0;
    for (const auto& m : drain())
    {
        if (m.header.type == MessageType::RESP_OK || m.header.type == MessageType::RESP_ERR)
        {
            EXPECT_EQ(m.header.type, MessageType::RESP_OK) << "request " << m.header.request_id;
            ++responses;
        }
    }
    EXPECT_EQ(responses, 6u);
}

TEST_F(ViewServiceTest, ClosingLastTabEmitsWindowClosed)
{
    handshake();
    create_view(1);
    drain();
    TabId only = service_.tabs().state(1)->active_tab_id;

    send(MessageType::REQ_CLOSE_TAB, encode_req_tab({1, only}), 1);
    auto msgs = drain();
    const Message* closed = find_last(msgs, MessageType::EVT_WINDOW_CLOSED);
    ASSERT_NE(closed, nullptr);
    auto evt = decode_evt_window(closed->payload);
    ASSERT_TRUE(evt.has_value());
    EXPECT_EQ(evt->window_id, 1u);
    EXPECT_NE(find_last(msgs, MessageType::RESP_OK), nullptr);
    EXPECT_FALSE(service_.tabs().has_window(1));
}

TEST_F(ViewServiceTest, DestroyUnknownWindowSucceeds)
{
    handshake();
    send(MessageType::REQ_DESTROY_VIEW, encode_req_window({42}), 42);
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::RESP_OK);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Snapshots
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ViewServiceTest, CaptureRepliesWithImage)
{
    handshake();
    create_view(1, {0, 0, 32, 16});
    host_.pump();
    drain();

    send(MessageType::REQ_CAPTURE_SNAPSHOT, encode_req_window({1}), 1);
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::RESP_SNAPSHOT);
    auto snap = decode_resp_snapshot(msgs[0].payload);
    ASSERT_TRUE(snap.has_value());
    ASSERT_TRUE(snap->image.has_value());
    EXPECT_EQ(snap->image->width, 32u);
    EXPECT_EQ(snap->image->height, 16u);
    EXPECT_TRUE(blobs_.read(snap->image->name).has_value());
}

TEST_F(ViewServiceTest, CaptureOfUnknownWindowHasNoImage)
{
    handshake();
    send(MessageType::REQ_CAPTURE_SNAPSHOT, encode_req_window({3}), 3);
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    auto snap = decode_resp_snapshot(msgs[0].payload);
    ASSERT_TRUE(snap.has_value());
    EXPECT_FALSE(snap->image.has_value());
}

TEST_F(ViewServiceTest, DestroyReleasesSnapshots)
{
    handshake();
    create_view(1, {0, 0, 8, 8});
    send(MessageType::REQ_CAPTURE_SNAPSHOT, encode_req_window({1}), 1);
    EXPECT_EQ(blobs_.active_count(), 1u);
    send(MessageType::REQ_DESTROY_VIEW, encode_req_window({1}), 1);
    EXPECT_EQ(blobs_.active_count(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Events and liveness
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ViewServiceTest, CrashIsReported)
{
    handshake();
    create_view(1);
    drain();
    static_cast<HeadlessSurface*>(service_.tabs().active_surface(1))->simulate_crash();

    auto msgs = drain();
    const Message* crashed = find_last(msgs, MessageType::EVT_SURFACE_CRASHED);
    ASSERT_NE(crashed, nullptr);
    auto evt = decode_evt_surface_crashed(crashed->payload);
    ASSERT_TRUE(evt.has_value());
    EXPECT_EQ(evt->window_id, 1u);
    EXPECT_EQ(evt->tab_id, service_.tabs().state(1)->active_tab_id);
}

TEST_F(ViewServiceTest, UserFocusIsReported)
{
    handshake();
    create_view(2);
    drain();
    static_cast<HeadlessSurface*>(service_.tabs().active_surface(2))->simulate_user_focus();
    auto msgs = drain();
    ASSERT_NE(find_last(msgs, MessageType::EVT_VIEW_FOCUSED), nullptr);
}

TEST_F(ViewServiceTest, HeartbeatAndStaleClient)
{
    using namespace std::chrono_literals;
    handshake();

    auto t0 = ViewService::Clock::now();
    service_.tick(t0);
    auto msgs = drain();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].header.type, MessageType::EVT_HEARTBEAT);
    EXPECT_FALSE(service_.client_stale());

    service_.tick(t0 + 50ms);
    EXPECT_TRUE(drain().empty());

    service_.tick(t0 + 301ms);
    EXPECT_TRUE(service_.client_stale());

    // Any traffic from the client clears it.
    Message beat;
    beat.header.type = MessageType::EVT_HEARTBEAT;
    ASSERT_TRUE(ui_->send(beat));
    service_.poll();
    EXPECT_FALSE(service_.client_stale());
}

TEST_F(ViewServiceTest, NoHeartbeatBeforeHandshake)
{
    service_.tick(ViewService::Clock::now());
    EXPECT_TRUE(drain().empty());
}
