#include "bounds_synchronizer.hpp"

#include <algorithm>
#include <tessera/logger.hpp>

#include "view_client.hpp"
#include "window_store.hpp"

namespace tessera::ui
{

BoundsSynchronizer::BoundsSynchronizer(ViewClient& client, ChromeInsets insets)
    : client_(client), insets_(insets)
{
}

RectF BoundsSynchronizer::content_rect(const WindowMeta& window, const ChromeInsets& insets)
{
    const RectF& b = window.bounds;

    double content_x = insets.sidebar + b.x + insets.border;
    double content_y = b.y + insets.title_bar;
    double content_w = b.width - insets.border * 2.0;
    double content_h = b.height - insets.title_bar - insets.border;

    size_t tab_count  = window.browser ? window.browser->state.tabs.size() : 0;
    double tab_offset = tab_count > 1 ? insets.tab_bar : 0.0;

    RectF r;
    r.x      = content_x + insets.padding;
    r.y      = content_y + insets.toolbar + tab_offset;
    r.width  = std::max(0.0, content_w - insets.padding * 2.0);
    r.height = std::max(0.0, content_h - insets.toolbar - tab_offset - insets.padding);
    return r;
}

void BoundsSynchronizer::update_window(const WindowMeta& window)
{
    if (window.type != WindowType::Browser)
        return;
    update_geometry(window.id, content_rect(window, insets_));
}

void BoundsSynchronizer::update_geometry(WindowId id, const RectF& rect)
{
    auto snapped = validate_rect(rect);
    if (!snapped)
    {
        TESSERA_LOG_WARN("bounds", "Dropping invalid geometry for window {}", id);
        return;
    }
    pending_[id] = *snapped;
}

size_t BoundsSynchronizer::on_frame()
{
    if (pending_.empty())
        return 0;

    auto   batch = std::move(pending_);
    size_t sent  = 0;
    pending_.clear();

    for (const auto& [id, rect] : batch)
    {
        auto it = last_sent_.find(id);
        if (it != last_sent_.end() && it->second == rect)
            continue;

        auto err = client_.set_bounds(id, rect);
        if (err != ipc::ErrorCode::None)
        {
            TESSERA_LOG_DEBUG("bounds", "setBounds for window {} not sent: {}", id,
                              ipc::to_string(err));
            continue;
        }
        last_sent_[id] = rect;
        ++sent;
    }
    return sent;
}

void BoundsSynchronizer::push_visibility(WindowId id, bool visible, bool focused)
{
    auto err = client_.set_visibility(id, visible, focused);
    if (err != ipc::ErrorCode::None)
        TESSERA_LOG_DEBUG("bounds", "setVisibility for window {} not sent: {}", id,
                          ipc::to_string(err));
}

std::vector<ipc::RestackEntry> BoundsSynchronizer::stacking_order(const WindowStore& store)
{
    std::vector<const WindowMeta*> browsers;
    for (const auto& w : store.windows())
    {
        if (w.type == WindowType::Browser)
            browsers.push_back(&w);
    }
    std::stable_sort(browsers.begin(), browsers.end(),
                     [](const WindowMeta* a, const WindowMeta* b) { return a->z_index < b->z_index; });

    std::vector<ipc::RestackEntry> order;
    order.reserve(browsers.size());
    for (const auto* w : browsers)
    {
        ipc::RestackEntry e;
        e.window_id    = w->id;
        e.is_frozen    = w->browser && is_frozen(w->browser->freeze);
        e.is_minimized = w->is_minimized;
        order.push_back(e);
    }
    return order;
}

bool BoundsSynchronizer::sync_stacking(const WindowStore& store)
{
    auto order = stacking_order(store);
    if (stack_sent_ && order == last_stack_)
        return false;

    auto err = client_.restack_windows(order);
    if (err != ipc::ErrorCode::None)
    {
        TESSERA_LOG_DEBUG("bounds", "restackWindows not sent: {}", ipc::to_string(err));
        return false;
    }
    TESSERA_LOG_TRACE("bounds", "Restacked {} windows", order.size());
    last_stack_ = std::move(order);
    stack_sent_ = true;
    return true;
}

void BoundsSynchronizer::forget(WindowId id)
{
    pending_.erase(id);
    last_sent_.erase(id);
}

std::optional<Rect> BoundsSynchronizer::last_sent(WindowId id) const
{
    auto it = last_sent_.find(id);
    if (it == last_sent_.end())
        return std::nullopt;
    return it->second;
}

}   // namespace tessera::ui
