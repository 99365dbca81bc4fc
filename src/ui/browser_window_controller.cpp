#include "browser_window_controller.hpp"

#include <tessera/logger.hpp>

#include "bounds_synchronizer.hpp"
#include "state_reconciler.hpp"
#include "view_lifecycle.hpp"

namespace tessera::ui
{

BrowserWindowController::BrowserWindowController(WindowId                  window_id,
                                                 const BrowserServices&    services,
                                                 std::chrono::milliseconds capture_timeout)
    : window_id_(window_id),
      services_(services),
      freeze_(window_id, services.store, services.client, capture_timeout)
{
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

void BrowserWindowController::mount()
{
    const auto* w = services_.store.find(window_id_);
    if (!w || !w->browser)
    {
        TESSERA_LOG_WARN("lifecycle", "Cannot mount window {}: not a browser window", window_id_);
        return;
    }

    const BrowserState& state = w->browser->state;
    std::string         initial_url;
    restore_urls_.clear();
    restore_active_ = 0;
    if (!state.tabs.empty())
    {
        initial_url = state.tabs.front().url;
        for (size_t i = 1; i < state.tabs.size(); ++i)
        {
            restore_urls_.push_back(state.tabs[i].url);
            if (state.tabs[i].id == state.active_tab_id)
                restore_active_ = i;
        }
    }

    last_focused_   = w->is_focused;
    last_minimized_ = w->is_minimized;
    last_tab_count_ = state.tabs.size();

    Rect bounds = validate_rect(BoundsSynchronizer::content_rect(*w, services_.bounds.insets()))
                      .value_or(Rect{});
    services_.bounds.forget(window_id_);
    mounted_ = true;

    std::weak_ptr<bool> alive = alive_;
    services_.lifecycle.mount(window_id_, bounds, initial_url,
                              [this, alive](const Reply& reply)
                              {
                                  if (alive.expired())
                                      return;
                                  on_mounted(reply);
                              });
}

void BrowserWindowController::unmount()
{
    if (!mounted_)
        return;
    mounted_ = false;
    restore_urls_.clear();
    services_.lifecycle.unmount(window_id_);
    services_.bounds.forget(window_id_);
}

void BrowserWindowController::on_mounted(const Reply& reply)
{
    if (!mounted_)
        return;
    if (!reply.ok())
    {
        TESSERA_LOG_ERROR("lifecycle", "View for window {} could not be created: {}", window_id_,
                          reply.message);
        return;
    }
    TESSERA_LOG_INFO("lifecycle", "View for window {} is live", window_id_);

    if (last_minimized_)
        push_visibility();
    services_.bounds.invalidate_stacking();
    services_.bounds.sync_stacking(services_.store);
    restore_tabs();
}

void BrowserWindowController::restore_tabs()
{
    if (restore_urls_.empty())
        return;

    struct Restore
    {
        std::vector<TabId> ids;   // index 0 is the tab createView made
        size_t             remaining = 0;
        size_t             active    = 0;
    };

    auto urls    = std::move(restore_urls_);
    auto restore = std::make_shared<Restore>();
    restore_urls_.clear();

    const auto* w = services_.store.find(window_id_);
    restore->ids.assign(urls.size() + 1, INVALID_TAB_ID);
    if (w && w->browser && !w->browser->state.tabs.empty())
        restore->ids[0] = w->browser->state.tabs.front().id;
    restore->remaining = urls.size();
    restore->active    = restore_active_;

    TESSERA_LOG_INFO("lifecycle", "Restoring {} more tabs in window {}", urls.size(), window_id_);

    std::weak_ptr<bool> alive  = alive_;
    WindowId            window = window_id_;
    auto finish = [this, alive, window, restore](size_t index, const Reply& reply)
    {
        if (reply.ok())
            restore->ids[index] = reply.tab_id;
        else
            TESSERA_LOG_WARN("lifecycle", "Restoring tab {} of window {} failed: {}", index, window,
                             reply.message);
        if (--restore->remaining > 0 || alive.expired() || !mounted_)
            return;
        TabId target = restore->ids[restore->active];
        if (target == INVALID_TAB_ID)
            return;
        auto err = services_.client.switch_tab(window, target);
        if (err != ipc::ErrorCode::None)
            TESSERA_LOG_WARN("lifecycle", "Reactivating tab {} of window {} failed: {}", target,
                             window, ipc::to_string(err));
    };

    for (size_t i = 0; i < urls.size(); ++i)
    {
        auto err = services_.client.create_tab(window_id_, urls[i],
                                               [finish, i](const Reply& reply) { finish(i + 1, reply); });
        if (err != ipc::ErrorCode::None)
        {
            Reply reply;
            reply.error   = err;
            reply.message = ipc::to_string(err);
            finish(i + 1, reply);
        }
    }
}

// ─── Store changes ───────────────────────────────────────────────────────────

void BrowserWindowController::on_window_changed(WindowChangeKind kind)
{
    const auto* w = services_.store.find(window_id_);
    if (!w || !mounted_)
        return;

    switch (kind)
    {
        case WindowChangeKind::Bounds:
            services_.bounds.update_window(*w);
            break;
        case WindowChangeKind::Browser:
        {
            // The tab bar appears or disappears with the second tab.
            size_t tabs = w->browser ? w->browser->state.tabs.size() : 0;
            if ((tabs > 1) != (last_tab_count_ > 1))
                services_.bounds.update_window(*w);
            last_tab_count_ = tabs;
            break;
        }
        case WindowChangeKind::Focus:
        {
            bool focused = w->is_focused;
            if (focused == last_focused_)
                break;
            last_focused_ = focused;
            freeze_.on_focus_changed(focused);
            push_visibility();
            break;
        }
        case WindowChangeKind::Minimized:
            if (w->is_minimized == last_minimized_)
                break;
            last_minimized_ = w->is_minimized;
            push_visibility();
            break;
        default:
            break;
    }
}

void BrowserWindowController::push_visibility()
{
    const auto* w = services_.store.find(window_id_);
    if (!w || !w->browser)
        return;
    bool visible = !w->is_minimized && !is_frozen(w->browser->freeze);
    services_.bounds.push_visibility(window_id_, visible, w->is_focused && visible);
}

void BrowserWindowController::on_snapshot_painted(const std::string& image_name)
{
    freeze_.on_snapshot_painted(image_name);
}

void BrowserWindowController::tick(FreezeController::Clock::time_point now)
{
    freeze_.tick(now);
}

// ─── Chrome commands ─────────────────────────────────────────────────────────

ipc::ErrorCode BrowserWindowController::load_url(const std::string& input, ReplyHandler done)
{
    return services_.reconciler.load_url(window_id_, input, std::move(done));
}

ipc::ErrorCode BrowserWindowController::navigate(NavigationAction action, ReplyHandler done)
{
    return services_.reconciler.navigate(window_id_, action, std::move(done));
}

ipc::ErrorCode BrowserWindowController::create_tab(const std::optional<std::string>& url,
                                                   ReplyHandler                      done)
{
    return services_.client.create_tab(window_id_, url, std::move(done));
}

ipc::ErrorCode BrowserWindowController::switch_tab(TabId tab_id, ReplyHandler done)
{
    return services_.client.switch_tab(window_id_, tab_id, std::move(done));
}

ipc::ErrorCode BrowserWindowController::close_tab(TabId tab_id, ReplyHandler done)
{
    return services_.client.close_tab(window_id_, tab_id, std::move(done));
}

}   // namespace tessera::ui
