#include <algorithm>
#include <tessera/tab_state.hpp>

namespace tessera
{

const TabState* BrowserState::find_tab(TabId id) const
{
    auto it = std::find_if(tabs.begin(), tabs.end(), [id](const TabState& t) { return t.id == id; });
    return it == tabs.end() ? nullptr : &*it;
}

TabState* BrowserState::find_tab(TabId id)
{
    auto it = std::find_if(tabs.begin(), tabs.end(), [id](const TabState& t) { return t.id == id; });
    return it == tabs.end() ? nullptr : &*it;
}

std::optional<NavigationAction> parse_navigation_action(std::string_view name)
{
    if (name == "back")
        return NavigationAction::Back;
    if (name == "forward")
        return NavigationAction::Forward;
    if (name == "reload")
        return NavigationAction::Reload;
    if (name == "stop")
        return NavigationAction::Stop;
    return std::nullopt;
}

const char* to_string(NavigationAction action)
{
    switch (action)
    {
        case NavigationAction::Back:
            return "back";
        case NavigationAction::Forward:
            return "forward";
        case NavigationAction::Reload:
            return "reload";
        case NavigationAction::Stop:
            return "stop";
    }
    return "unknown";
}

}   // namespace tessera
