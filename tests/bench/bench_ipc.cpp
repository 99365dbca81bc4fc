#include <benchmark/benchmark.h>
#include <string>
#include <vector>

#include "core/url.hpp"
#include "ipc/codec.hpp"
#include "ui/bounds_synchronizer.hpp"
#include "ui/window_store.hpp"

using namespace tessera;

namespace
{

BrowserState make_state(size_t tabs)
{
    BrowserState s;
    for (size_t i = 0; i < tabs; ++i)
    {
        TabState t;
        t.id          = static_cast<TabId>(i + 1);
        t.url         = "https://www.are.na/channel/" + std::to_string(i);
        t.title       = "Channel " + std::to_string(i);
        t.favicon_url = "https://www.are.na/favicon.ico";
        t.can_go_back = i % 2 == 0;
        t.nav_seq     = i;
        s.tabs.push_back(t);
    }
    s.active_tab_id   = 1;
    s.tab_group_title = "Research";
    return s;
}

ipc::Message framed(ipc::MessageType type, std::vector<uint8_t> payload)
{
    ipc::Message msg;
    msg.header.type        = type;
    msg.header.seq         = 42;
    msg.header.window_id   = 7;
    msg.header.payload_len = static_cast<uint32_t>(payload.size());
    msg.payload            = std::move(payload);
    return msg;
}

}   // namespace

// ─── Wire codec ──────────────────────────────────────────────────────────────

static void BM_Encode_SetBounds(benchmark::State& state)
{
    ipc::ReqSetBoundsPayload p;
    p.window_id = 7;
    p.bounds    = {104, 128, 792, 518};
    for (auto _ : state)
    {
        auto bytes = ipc::encode_message(framed(ipc::MessageType::REQ_SET_BOUNDS, ipc::encode_req_set_bounds(p)));
        benchmark::DoNotOptimize(bytes.data());
    }
}
BENCHMARK(BM_Encode_SetBounds)->Unit(benchmark::kNanosecond);

static void BM_Encode_StateChanged(benchmark::State& state)
{
    ipc::EvtStateChangedPayload p;
    p.window_id = 7;
    p.state     = make_state(static_cast<size_t>(state.range(0)));
    for (auto _ : state)
    {
        auto bytes = ipc::encode_evt_state_changed(p);
        benchmark::DoNotOptimize(bytes.data());
    }
}
BENCHMARK(BM_Encode_StateChanged)->Arg(1)->Arg(8)->Arg(64)->Unit(benchmark::kMicrosecond);

static void BM_Decode_StateChanged(benchmark::State& state)
{
    ipc::EvtStateChangedPayload p;
    p.window_id = 7;
    p.state     = make_state(static_cast<size_t>(state.range(0)));
    auto bytes  = ipc::encode_message(
        framed(ipc::MessageType::EVT_STATE_CHANGED, ipc::encode_evt_state_changed(p)));

    for (auto _ : state)
    {
        auto msg = ipc::decode_message(bytes);
        auto out = ipc::decode_evt_state_changed(msg->payload);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Decode_StateChanged)->Arg(1)->Arg(8)->Arg(64)->Unit(benchmark::kMicrosecond);

// ─── Layout ──────────────────────────────────────────────────────────────────

static void BM_ContentRect(benchmark::State& state)
{
    ui::WindowMeta w;
    w.bounds = {100.25, 50.5, 800.0, 600.0};
    w.browser.emplace();
    w.browser->state = make_state(3);
    ui::ChromeInsets insets;
    for (auto _ : state)
    {
        auto r = ui::BoundsSynchronizer::content_rect(w, insets);
        benchmark::DoNotOptimize(validate_rect(r));
    }
}
BENCHMARK(BM_ContentRect)->Unit(benchmark::kNanosecond);

static void BM_StackingOrder(benchmark::State& state)
{
    ui::WindowStore store;
    for (int64_t i = 0; i < state.range(0); ++i)
    {
        ui::WindowMeta w;
        w.type = i % 4 == 0 ? ui::WindowType::Notes : ui::WindowType::Browser;
        store.add(w);
    }
    for (auto _ : state)
    {
        auto order = ui::BoundsSynchronizer::stacking_order(store);
        benchmark::DoNotOptimize(order.data());
    }
}
BENCHMARK(BM_StackingOrder)->Arg(4)->Arg(32)->Unit(benchmark::kNanosecond);

// ─── URL handling ────────────────────────────────────────────────────────────

static void BM_NormalizeUrl(benchmark::State& state)
{
    const std::vector<std::string> inputs = {
        "are.na", "https://www.are.na/channel/x", "  example.com/path?q=1  ", "mailto:a@b.c"};
    size_t i = 0;
    for (auto _ : state)
    {
        auto out = normalize_url(inputs[i++ % inputs.size()]);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_NormalizeUrl)->Unit(benchmark::kNanosecond);

static void BM_IsAuthenticationUrl(benchmark::State& state)
{
    const std::string url = "https://www.are.na/channel/some-long-slug?page=3&per=24#top";
    for (auto _ : state)
        benchmark::DoNotOptimize(is_authentication_url(url));
}
BENCHMARK(BM_IsAuthenticationUrl)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
