#include "window_store.hpp"

#include <algorithm>
#include <sstream>
#include <tessera/logger.hpp>

#include "../core/json_util.hpp"

namespace tessera::ui
{

static constexpr int LAYOUT_VERSION = 1;

const char* to_string(WindowType type)
{
    switch (type)
    {
        case WindowType::Browser: return "browser";
        case WindowType::Chat:    return "chat";
        case WindowType::Notes:   return "notes";
    }
    return "unknown";
}

std::optional<WindowType> parse_window_type(std::string_view name)
{
    if (name == "browser")
        return WindowType::Browser;
    if (name == "chat")
        return WindowType::Chat;
    if (name == "notes")
        return WindowType::Notes;
    return std::nullopt;
}

const char* to_string(WindowChangeKind kind)
{
    switch (kind)
    {
        case WindowChangeKind::Added:     return "added";
        case WindowChangeKind::Removed:   return "removed";
        case WindowChangeKind::Bounds:    return "bounds";
        case WindowChangeKind::Focus:     return "focus";
        case WindowChangeKind::Minimized: return "minimized";
        case WindowChangeKind::ZOrder:    return "z-order";
        case WindowChangeKind::Title:     return "title";
        case WindowChangeKind::Browser:   return "browser";
        case WindowChangeKind::Freeze:    return "freeze";
    }
    return "unknown";
}

// ─── Mutation ────────────────────────────────────────────────────────────────

WindowId WindowStore::add(WindowMeta meta)
{
    if (meta.id == INVALID_WINDOW_ID || find(meta.id))
        meta.id = next_id_;
    next_id_     = std::max(next_id_, meta.id + 1);
    meta.z_index = top_z() + 1;
    if (meta.type == WindowType::Browser && !meta.browser)
        meta.browser.emplace();
    if (meta.type != WindowType::Browser)
        meta.browser.reset();

    WindowId id = meta.id;
    windows_.push_back(std::move(meta));
    TESSERA_LOG_DEBUG("store", "Added {} window {}", to_string(windows_.back().type), id);
    emit(id, WindowChangeKind::Added);
    return id;
}

bool WindowStore::remove(WindowId id)
{
    auto it = std::find_if(windows_.begin(), windows_.end(),
                           [id](const WindowMeta& w) { return w.id == id; });
    if (it == windows_.end())
        return false;
    windows_.erase(it);
    TESSERA_LOG_DEBUG("store", "Removed window {}", id);
    emit(id, WindowChangeKind::Removed);
    return true;
}

WindowMeta* WindowStore::find(WindowId id)
{
    for (auto& w : windows_)
    {
        if (w.id == id)
            return &w;
    }
    return nullptr;
}

const WindowMeta* WindowStore::find(WindowId id) const
{
    return const_cast<WindowStore*>(this)->find(id);
}

std::optional<WindowId> WindowStore::focused_window() const
{
    for (const auto& w : windows_)
    {
        if (w.is_focused)
            return w.id;
    }
    return std::nullopt;
}

bool WindowStore::set_bounds(WindowId id, const RectF& bounds)
{
    auto* w = find(id);
    if (!w)
        return false;
    if (w->bounds == bounds)
        return true;
    w->bounds = bounds;
    emit(id, WindowChangeKind::Bounds);
    return true;
}

bool WindowStore::set_title(WindowId id, const std::string& title)
{
    auto* w = find(id);
    if (!w)
        return false;
    if (w->title == title)
        return true;
    w->title = title;
    emit(id, WindowChangeKind::Title);
    return true;
}

bool WindowStore::set_focused(WindowId id)
{
    auto* target = find(id);
    if (!target)
        return false;

    std::vector<WindowChange> changes;
    for (auto& w : windows_)
    {
        if (w.id != id && w.is_focused)
        {
            w.is_focused = false;
            changes.push_back({w.id, WindowChangeKind::Focus});
        }
    }

    if (target->is_minimized)
    {
        target->is_minimized = false;
        changes.push_back({id, WindowChangeKind::Minimized});
    }
    if (!target->is_focused)
    {
        target->is_focused = true;
        changes.push_back({id, WindowChangeKind::Focus});
    }
    int32_t top = top_z();
    bool    alone_on_top =
        std::count_if(windows_.begin(), windows_.end(),
                      [top](const WindowMeta& w) { return w.z_index == top; }) == 1;
    if (target->z_index != top || !alone_on_top)
    {
        target->z_index = top + 1;
        changes.push_back({id, WindowChangeKind::ZOrder});
    }

    for (const auto& c : changes)
        emit(c.id, c.kind);
    return true;
}

void WindowStore::clear_focus()
{
    std::vector<WindowId> blurred;
    for (auto& w : windows_)
    {
        if (w.is_focused)
        {
            w.is_focused = false;
            blurred.push_back(w.id);
        }
    }
    for (WindowId id : blurred)
        emit(id, WindowChangeKind::Focus);
}

bool WindowStore::set_minimized(WindowId id, bool minimized)
{
    auto* w = find(id);
    if (!w)
        return false;
    if (w->is_minimized == minimized)
        return true;

    bool blurred    = minimized && w->is_focused;
    w->is_minimized = minimized;
    if (blurred)
        w->is_focused = false;

    emit(id, WindowChangeKind::Minimized);
    if (blurred)
        emit(id, WindowChangeKind::Focus);
    return true;
}

bool WindowStore::update_browser(WindowId id, const std::function<void(BrowserPayload&)>& fn)
{
    auto* w = find(id);
    if (!w || !w->browser)
        return false;
    fn(*w->browser);
    emit(id, WindowChangeKind::Browser);
    return true;
}

bool WindowStore::set_freeze_state(WindowId id, FreezeState state)
{
    auto* w = find(id);
    if (!w || !w->browser)
    {
        TESSERA_LOG_WARN("store", "Cannot set freeze state of non-browser window {}", id);
        return false;
    }
    if (w->browser->freeze == state)
        return true;
    w->browser->freeze = std::move(state);
    TESSERA_LOG_DEBUG("store", "Window {} freeze state {}", id,
                      freeze_state_name(w->browser->freeze));
    emit(id, WindowChangeKind::Freeze);
    return true;
}

int32_t WindowStore::top_z() const
{
    int32_t top = 0;
    for (const auto& w : windows_)
        top = std::max(top, w.z_index);
    return top;
}

void WindowStore::emit(WindowId id, WindowChangeKind kind)
{
    if (on_change_)
        on_change_({id, kind});
}

// ─── Persistence ─────────────────────────────────────────────────────────────

std::string WindowStore::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << LAYOUT_VERSION << ",\n";
    os << "  \"next_id\": " << next_id_ << ",\n";
    os << "  \"windows\": [\n";
    for (size_t wi = 0; wi < windows_.size(); ++wi)
    {
        const auto& w = windows_[wi];
        os << "    {\n";
        os << "      \"id\": " << w.id << ",\n";
        os << "      \"type\": \"" << to_string(w.type) << "\",\n";
        os << "      \"title\": \"" << json::escape(w.title) << "\",\n";
        os << "      \"x\": " << w.bounds.x << ",\n";
        os << "      \"y\": " << w.bounds.y << ",\n";
        os << "      \"width\": " << w.bounds.width << ",\n";
        os << "      \"height\": " << w.bounds.height << ",\n";
        os << "      \"z_index\": " << w.z_index << ",\n";
        os << "      \"is_minimized\": " << (w.is_minimized ? "true" : "false");

        if (w.browser)
        {
            const auto& s = w.browser->state;
            os << ",\n";
            os << "      \"active_tab_id\": " << s.active_tab_id << ",\n";
            if (s.tab_group_title)
                os << "      \"tab_group_title\": \"" << json::escape(*s.tab_group_title) << "\",\n";
            os << "      \"tabs\": [\n";
            for (size_t ti = 0; ti < s.tabs.size(); ++ti)
            {
                const auto& t = s.tabs[ti];
                os << "        {\"id\": " << t.id << ", \"url\": \"" << json::escape(t.url)
                   << "\", \"title\": \"" << json::escape(t.title) << "\"";
                if (t.favicon_url)
                    os << ", \"favicon_url\": \"" << json::escape(*t.favicon_url) << "\"";
                os << "}" << (ti + 1 < s.tabs.size() ? "," : "") << "\n";
            }
            os << "      ]";
        }
        os << "\n    }" << (wi + 1 < windows_.size() ? "," : "") << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

bool WindowStore::deserialize(const std::string& json)
{
    auto first = json.find_first_not_of(" \t\n\r");
    if (first == std::string::npos || json[first] != '{')
        return false;

    auto version = json::read_number(json, "version");
    if (version && static_cast<int>(*version) > LAYOUT_VERSION)
    {
        TESSERA_LOG_WARN("store", "Layout version {} is newer than {}, ignoring",
                         static_cast<int>(*version), LAYOUT_VERSION);
        return false;
    }

    std::vector<WindowMeta> loaded;
    WindowId                max_id = 0;
    for (const auto& obj : json::read_object_array(json, "windows"))
    {
        std::string scalars = json::strip_array(obj, "tabs");

        WindowMeta w;
        auto       id   = json::read_number(scalars, "id");
        auto       type = parse_window_type(json::read_string(scalars, "type").value_or(""));
        if (!id || *id < 1 || !type)
        {
            TESSERA_LOG_WARN("store", "Skipping malformed window record");
            continue;
        }
        w.id            = static_cast<WindowId>(*id);
        w.type          = *type;
        w.title         = json::read_string(scalars, "title").value_or("");
        w.bounds.x      = json::read_number(scalars, "x").value_or(0.0);
        w.bounds.y      = json::read_number(scalars, "y").value_or(0.0);
        w.bounds.width  = std::max(0.0, json::read_number(scalars, "width").value_or(0.0));
        w.bounds.height = std::max(0.0, json::read_number(scalars, "height").value_or(0.0));
        w.z_index       = static_cast<int32_t>(json::read_number(scalars, "z_index").value_or(0.0));
        w.is_minimized  = json::read_bool(scalars, "is_minimized").value_or(false);

        if (w.type == WindowType::Browser)
        {
            BrowserPayload payload;
            auto&          s = payload.state;
            s.active_tab_id  = static_cast<TabId>(json::read_number(scalars, "active_tab_id").value_or(0.0));
            s.tab_group_title = json::read_string(scalars, "tab_group_title");
            for (const auto& tab_obj : json::read_object_array(obj, "tabs"))
            {
                TabState t;
                t.id          = static_cast<TabId>(json::read_number(tab_obj, "id").value_or(0.0));
                t.url         = json::read_string(tab_obj, "url").value_or("");
                t.title       = json::read_string(tab_obj, "title").value_or(t.title);
                t.favicon_url = json::read_string(tab_obj, "favicon_url");
                if (t.id == INVALID_TAB_ID)
                    continue;
                s.tabs.push_back(std::move(t));
            }
            if (!s.tabs.empty() && !s.find_tab(s.active_tab_id))
                s.active_tab_id = s.tabs.front().id;
            w.browser = std::move(payload);
        }

        if (std::any_of(loaded.begin(), loaded.end(),
                        [&](const WindowMeta& other) { return other.id == w.id; }))
        {
            TESSERA_LOG_WARN("store", "Skipping duplicate window id {}", w.id);
            continue;
        }
        max_id = std::max(max_id, w.id);
        loaded.push_back(std::move(w));
    }

    // Only the top-most window that is not minimized comes back focused.
    WindowMeta* top = nullptr;
    for (auto& w : loaded)
    {
        if (!w.is_minimized && (!top || w.z_index >= top->z_index))
            top = &w;
    }
    if (top)
        top->is_focused = true;

    std::vector<WindowId> removed;
    for (const auto& w : windows_)
        removed.push_back(w.id);

    windows_ = std::move(loaded);
    auto next = static_cast<WindowId>(json::read_number(json, "next_id").value_or(0.0));
    next_id_  = std::max(next, max_id + 1);

    for (WindowId id : removed)
        emit(id, WindowChangeKind::Removed);
    std::vector<WindowId> added;
    for (const auto& w : windows_)
        added.push_back(w.id);
    for (WindowId id : added)
        emit(id, WindowChangeKind::Added);

    TESSERA_LOG_INFO("store", "Restored {} windows", windows_.size());
    return true;
}

void WindowStore::save(KeyValueStore& kv, KeyValueStore::DoneHandler done) const
{
    kv.set(STORAGE_KEY, serialize(),
           [done = std::move(done)](bool ok)
           {
               if (!ok)
                   TESSERA_LOG_ERROR("store", "Saving window layout failed");
               if (done)
                   done(ok);
           });
}

void WindowStore::load(KeyValueStore& kv, LoadHandler done)
{
    kv.get(STORAGE_KEY,
           [this, done = std::move(done)](std::optional<std::string> value)
           {
               bool ok = true;
               if (value)
               {
                   ok = deserialize(*value);
                   if (!ok)
                       TESSERA_LOG_WARN("store", "Stored window layout is unreadable");
               }
               if (done)
                   done(ok);
           });
}

}   // namespace tessera::ui
