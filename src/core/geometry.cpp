#include <cmath>
#include <limits>
#include <tessera/geometry.hpp>

namespace tessera
{

namespace
{

// Layout arithmetic accumulates noise like 500.0000000001; ignore it.
constexpr double SNAP_EPSILON = 1e-6;

int32_t clamp_to_i32(double v)
{
    if (v > static_cast<double>(std::numeric_limits<int32_t>::max()))
        return std::numeric_limits<int32_t>::max();
    if (v < static_cast<double>(std::numeric_limits<int32_t>::min()))
        return std::numeric_limits<int32_t>::min();
    return static_cast<int32_t>(v);
}

}   // namespace

Rect round_rect(const RectF& r)
{
    return Rect{clamp_to_i32(std::floor(r.x + SNAP_EPSILON)),
                clamp_to_i32(std::floor(r.y + SNAP_EPSILON)),
                clamp_to_i32(std::ceil(r.width - SNAP_EPSILON)),
                clamp_to_i32(std::ceil(r.height - SNAP_EPSILON))};
}

std::optional<Rect> validate_rect(const RectF& r)
{
    if (!std::isfinite(r.x) || !std::isfinite(r.y) || !std::isfinite(r.width)
        || !std::isfinite(r.height))
        return std::nullopt;
    if (r.width < 0.0 || r.height < 0.0)
        return std::nullopt;
    return round_rect(r);
}

}   // namespace tessera
