#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tessera/fwd.hpp>
#include <vector>

namespace tessera
{

// Navigation state of one tab.  The view process is the only writer once
// the tab exists; the UI keeps a read-only mirror.
struct TabState
{
    TabId                      id = INVALID_TAB_ID;
    std::string                url;
    std::string                title = "New Tab";
    std::optional<std::string> favicon_url;
    bool                       is_loading     = false;
    bool                       can_go_back    = false;
    bool                       can_go_forward = false;
    std::optional<std::string> error;
    NavSeq                     nav_seq = 0;   // latest UI-issued load applied to this tab

    bool operator==(const TabState&) const = default;
};

// Full navigation state of one browser window, as carried by state-changed.
struct BrowserState
{
    std::vector<TabState>      tabs;
    TabId                      active_tab_id = INVALID_TAB_ID;
    std::optional<std::string> tab_group_title;

    bool operator==(const BrowserState&) const = default;

    const TabState* find_tab(TabId id) const;
    TabState*       find_tab(TabId id);
    const TabState* active_tab() const { return find_tab(active_tab_id); }
};

// Reference to a captured snapshot bitmap (RGBA8).  `name` identifies the
// blob that holds the pixels; the bitmap itself never crosses the channel.
struct ImageRef
{
    std::string name;
    uint32_t    width  = 0;
    uint32_t    height = 0;

    bool operator==(const ImageRef&) const = default;
};

enum class NavigationAction : uint8_t
{
    Back    = 1,
    Forward = 2,
    Reload  = 3,
    Stop    = 4,
};

std::optional<NavigationAction> parse_navigation_action(std::string_view name);
const char*                      to_string(NavigationAction action);

}   // namespace tessera
