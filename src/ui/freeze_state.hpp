#pragma once

#include <optional>
#include <tessera/tab_state.hpp>
#include <variant>

namespace tessera::ui
{

// ─── Freeze state ────────────────────────────────────────────────────────────
// Active → Capturing → AwaitingRender → Frozen → Active.  Only the two
// later states carry a snapshot, so "capturing with an image" or
// "frozen without one" cannot be expressed.  Never persisted.

struct FreezeActive
{
    bool operator==(const FreezeActive&) const = default;
};

struct FreezeCapturing
{
    bool operator==(const FreezeCapturing&) const = default;
};

struct FreezeAwaitingRender
{
    ImageRef snapshot;

    bool operator==(const FreezeAwaitingRender&) const = default;
};

struct FreezeFrozen
{
    ImageRef snapshot;

    bool operator==(const FreezeFrozen&) const = default;
};

using FreezeState = std::variant<FreezeActive, FreezeCapturing, FreezeAwaitingRender, FreezeFrozen>;

inline const char* freeze_state_name(const FreezeState& state)
{
    switch (state.index())
    {
        case 0: return "ACTIVE";
        case 1: return "CAPTURING";
        case 2: return "AWAITING_RENDER";
        case 3: return "FROZEN";
    }
    return "UNKNOWN";
}

inline bool is_active(const FreezeState& state)
{
    return std::holds_alternative<FreezeActive>(state);
}

// Only a painted snapshot lets the live surface be hidden.
inline bool is_frozen(const FreezeState& state)
{
    return std::holds_alternative<FreezeFrozen>(state);
}

// The snapshot to paint in place of the live surface, if any.
inline std::optional<ImageRef> snapshot_of(const FreezeState& state)
{
    if (const auto* s = std::get_if<FreezeAwaitingRender>(&state))
        return s->snapshot;
    if (const auto* s = std::get_if<FreezeFrozen>(&state))
        return s->snapshot;
    return std::nullopt;
}

}   // namespace tessera::ui
