#pragma once

#include <cstdint>
#include <optional>

namespace tessera
{

// Integer pixel rectangle, the only geometry a surface ever receives.
struct Rect
{
    int32_t x      = 0;
    int32_t y      = 0;
    int32_t width  = 0;
    int32_t height = 0;

    bool operator==(const Rect&) const = default;

    bool empty() const { return width <= 0 || height <= 0; }
};

// Layout-space rectangle as produced by the UI; may be fractional.
struct RectF
{
    double x      = 0.0;
    double y      = 0.0;
    double width  = 0.0;
    double height = 0.0;

    bool operator==(const RectF&) const = default;
};

// Snap a layout rect to whole pixels.  Not round-to-nearest: x and y are
// floored and width and height are ceiled, each independently, so
// {10.6, 10.4, 500.5, 400.9} becomes {10, 10, 501, 401}.  A surface never
// starts right of its layout slot nor comes out narrower than it.  Values
// within 1e-6 of an integer snap to it, so 99.9999999999 stays 100.
// The surface API truncates, and forwarding fractional values leaves
// visible seams along the right and bottom edges.
Rect round_rect(const RectF& r);

// Returns the rounded rect, or nullopt if width or height is negative or
// any component is not finite.
std::optional<Rect> validate_rect(const RectF& r);

}   // namespace tessera
