#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>
#include <tessera/tab_state.hpp>
#include <vector>

#include "freeze_state.hpp"
#include "kv_store.hpp"

namespace tessera::ui
{

enum class WindowType : uint8_t
{
    Browser,
    Chat,
    Notes,
};

const char*               to_string(WindowType type);
std::optional<WindowType> parse_window_type(std::string_view name);

// A loadUrl the UI has issued and the view process has not yet
// confirmed.  Only the latest request per window is tracked.
struct InflightNavigation
{
    TabId       tab_id = INVALID_TAB_ID;
    NavSeq      seq    = 0;
    std::string requested_url;

    bool operator==(const InflightNavigation&) const = default;
};

// Browser-specific part of a window.  `state` mirrors the view process;
// `freeze` and `inflight` are UI-local and never persisted.
struct BrowserPayload
{
    BrowserState                      state;
    FreezeState                       freeze = FreezeActive{};
    std::optional<InflightNavigation> inflight;
};

struct WindowMeta
{
    WindowId    id   = INVALID_WINDOW_ID;
    WindowType  type = WindowType::Browser;
    std::string title;
    RectF       bounds;
    int32_t     z_index      = 0;
    bool        is_focused   = false;
    bool        is_minimized = false;

    // Present iff type == Browser.
    std::optional<BrowserPayload> browser;
};

enum class WindowChangeKind : uint8_t
{
    Added,
    Removed,
    Bounds,
    Focus,
    Minimized,
    ZOrder,
    Title,
    Browser,
    Freeze,
};

const char* to_string(WindowChangeKind kind);

struct WindowChange
{
    WindowId         id   = INVALID_WINDOW_ID;
    WindowChangeKind kind = WindowChangeKind::Added;
};

/**
 * WindowStore — the UI process's window metadata.
 *
 * Sole owner of WindowMeta.  Every mutation is reported to the change
 * handler after the store is consistent again, so handlers may read and
 * mutate the store themselves.  Handlers receive ids, never references:
 * the window may be gone by the time a later change is delivered.
 */
class WindowStore
{
   public:
    using ChangeHandler = std::function<void(const WindowChange&)>;
    using LoadHandler   = std::function<void(bool)>;

    static constexpr const char* STORAGE_KEY = "windows";

    WindowStore() = default;

    WindowStore(const WindowStore&)            = delete;
    WindowStore& operator=(const WindowStore&) = delete;

    // Assigns an id when meta.id is 0 and places the window on top.
    // Browser windows get an empty payload if none is given.
    WindowId add(WindowMeta meta);
    bool     remove(WindowId id);

    WindowMeta*       find(WindowId id);
    const WindowMeta* find(WindowId id) const;

    // Insertion order.
    const std::vector<WindowMeta>& windows() const { return windows_; }
    size_t                         count() const { return windows_.size(); }

    std::optional<WindowId> focused_window() const;

    bool set_bounds(WindowId id, const RectF& bounds);
    bool set_title(WindowId id, const std::string& title);

    // Focuses `id`, blurs the previously focused window and raises `id`
    // above every other window.  Minimized windows are restored.
    bool set_focused(WindowId id);
    void clear_focus();

    // Minimizing also blurs.
    bool set_minimized(WindowId id, bool minimized);

    // Mutate the browser payload in place.  Returns false for unknown or
    // non-browser windows.
    bool update_browser(WindowId id, const std::function<void(BrowserPayload&)>& fn);
    bool set_freeze_state(WindowId id, FreezeState state);

    void set_change_handler(ChangeHandler handler) { on_change_ = std::move(handler); }

    // ─── Persistence ─────────────────────────────────────────────────────

    std::string serialize() const;

    // Replaces the current windows.  Every browser window comes back
    // ACTIVE, and only the top-most visible window is focused.
    bool deserialize(const std::string& json);

    void save(KeyValueStore& kv, KeyValueStore::DoneHandler done = nullptr) const;

    // Reads STORAGE_KEY and deserializes it.  A missing key leaves the
    // store empty and reports true.
    void load(KeyValueStore& kv, LoadHandler done = nullptr);

   private:
    int32_t top_z() const;
    void    emit(WindowId id, WindowChangeKind kind);

    std::vector<WindowMeta> windows_;
    WindowId                next_id_ = 1;
    ChangeHandler           on_change_;
};

}   // namespace tessera::ui
