#include "view_registry.hpp"

#include <algorithm>
#include <tessera/logger.hpp>

namespace tessera::view
{

ViewRegistry::ViewRegistry(SurfaceHost& host) : host_(host) {}

ViewRegistry::~ViewRegistry()
{
    for (auto& [key, surface] : surfaces_)
    {
        surface->set_event_handler(nullptr);
        host_.detach(surface.get());
    }
}

Surface* ViewRegistry::create_surface(WindowId           window_id,
                                      TabId              tab_id,
                                      const std::string& initial_url)
{
    Key  key{window_id, tab_id};
    auto it = surfaces_.find(key);
    if (it != surfaces_.end())
    {
        TESSERA_LOG_DEBUG("registry",
                          "Surface for window {} tab {} already exists, reusing it",
                          window_id,
                          tab_id);
        return it->second.get();
    }

    auto surface = host_.create_surface();
    if (!surface)
    {
        TESSERA_LOG_ERROR("registry", "Host refused to create a surface for window {}", window_id);
        return nullptr;
    }

    Surface* raw = surface.get();
    raw->set_event_handler([this, window_id, tab_id](const SurfaceEvent& ev)
                           { on_surface_event(window_id, tab_id, ev); });
    surfaces_.emplace(key, std::move(surface));

    host_.attach(raw);
    if (!initial_url.empty())
        raw->load_url(initial_url);

    TESSERA_LOG_DEBUG("registry", "Created surface for window {} tab {}", window_id, tab_id);
    return raw;
}

bool ViewRegistry::destroy_surface(WindowId window_id, TabId tab_id)
{
    auto it = surfaces_.find(Key{window_id, tab_id});
    if (it == surfaces_.end())
    {
        TESSERA_LOG_DEBUG("registry",
                          "destroy_surface: no surface for window {} tab {}",
                          window_id,
                          tab_id);
        return false;
    }

    auto surface = std::move(it->second);
    surfaces_.erase(it);
    surface->set_event_handler(nullptr);
    host_.detach(surface.get());

    TESSERA_LOG_DEBUG("registry", "Destroyed surface for window {} tab {}", window_id, tab_id);
    return true;
}

size_t ViewRegistry::destroy_window(WindowId window_id)
{
    std::vector<TabId> tabs;
    for (const auto& [key, surface] : surfaces_)
    {
        if (key.window_id == window_id)
            tabs.push_back(key.tab_id);
    }
    for (TabId tab_id : tabs)
        destroy_surface(window_id, tab_id);
    return tabs.size();
}

bool ViewRegistry::set_bounds(WindowId window_id, TabId tab_id, const RectF& bounds)
{
    Surface* surface = find(window_id, tab_id);
    if (!surface)
        return false;

    auto rect = validate_rect(bounds);
    if (!rect)
    {
        TESSERA_LOG_WARN("registry",
                         "Rejected bounds for window {}: {}x{}",
                         window_id,
                         bounds.width,
                         bounds.height);
        return false;
    }
    surface->set_bounds(*rect);
    return true;
}

bool ViewRegistry::set_visible(WindowId window_id, TabId tab_id, bool visible)
{
    Surface* surface = find(window_id, tab_id);
    if (!surface)
    {
        // Normal during teardown.
        TESSERA_LOG_DEBUG("registry", "set_visible: no surface for window {}", window_id);
        return false;
    }

    surface->set_visible(visible);
    if (visible)
        host_.attach(surface);
    else
        host_.detach(surface);
    return true;
}

bool ViewRegistry::restack(const std::vector<StackEntry>& ordered)
{
    std::vector<Surface*> to_show;
    std::vector<Surface*> to_hide;
    for (const auto& entry : ordered)
    {
        Surface* surface = find(entry.window_id, entry.tab_id);
        if (!surface)
            continue;
        if (entry.hidden)
            to_hide.push_back(surface);
        else
            to_show.push_back(surface);
    }

    bool changed = false;
    for (Surface* surface : to_hide)
    {
        if (host_.is_attached(surface))
        {
            host_.detach(surface);
            changed = true;
        }
    }

    if (host_.children() == to_show)
    {
        TESSERA_LOG_TRACE("registry", "restack: order already correct");
        return changed;
    }

    for (Surface* surface : to_show)
        host_.detach(surface);
    for (Surface* surface : to_show)
        host_.attach(surface);

    TESSERA_LOG_DEBUG("registry", "restack: reordered {} surfaces", to_show.size());
    return true;
}

std::optional<size_t> ViewRegistry::stack_slot(WindowId window_id, TabId tab_id) const
{
    Surface* surface = find(window_id, tab_id);
    if (!surface)
        return std::nullopt;
    auto children = host_.children();
    auto it       = std::find(children.begin(), children.end(), surface);
    if (it == children.end())
        return std::nullopt;
    return static_cast<size_t>(it - children.begin());
}

bool ViewRegistry::attach_at(WindowId window_id, TabId tab_id, size_t slot)
{
    Surface* surface = find(window_id, tab_id);
    if (!surface)
    {
        TESSERA_LOG_DEBUG("registry", "attach_at: no surface for window {} tab {}", window_id, tab_id);
        return false;
    }

    host_.detach(surface);
    auto above = host_.children();
    slot       = std::min(slot, above.size());
    above.erase(above.begin(), above.begin() + static_cast<std::ptrdiff_t>(slot));

    for (Surface* s : above)
        host_.detach(s);
    surface->set_visible(true);
    host_.attach(surface);
    for (Surface* s : above)
        host_.attach(s);

    TESSERA_LOG_TRACE("registry", "Attached window {} tab {} at slot {}", window_id, tab_id, slot);
    return true;
}

Surface* ViewRegistry::find(WindowId window_id, TabId tab_id) const
{
    auto it = surfaces_.find(Key{window_id, tab_id});
    return it == surfaces_.end() ? nullptr : it->second.get();
}

bool ViewRegistry::contains(WindowId window_id, TabId tab_id) const
{
    return surfaces_.count(Key{window_id, tab_id}) > 0;
}

bool ViewRegistry::is_attached(WindowId window_id, TabId tab_id) const
{
    Surface* surface = find(window_id, tab_id);
    return surface && host_.is_attached(surface);
}

size_t ViewRegistry::count_for_window(WindowId window_id) const
{
    size_t n = 0;
    for (const auto& [key, surface] : surfaces_)
    {
        if (key.window_id == window_id)
            ++n;
    }
    return n;
}

void ViewRegistry::on_surface_event(WindowId window_id, TabId tab_id, const SurfaceEvent& ev)
{
    if (ev.type == SurfaceEventType::Crashed)
    {
        TESSERA_LOG_WARN("registry", "Surface for window {} tab {} crashed", window_id, tab_id);
        if (crash_handler_)
            crash_handler_(window_id, tab_id);
        return;
    }
    if (event_handler_)
        event_handler_(window_id, tab_id, ev);
}

}   // namespace tessera::view
