#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tessera/geometry.hpp>
#include <vector>

namespace tessera::view
{

// ─── Surface events ──────────────────────────────────────────────────────────
// Navigation notifications reported by a surface's renderer.

enum class SurfaceEventType
{
    StartLoading,
    Navigated,        // url, can_go_back, can_go_forward
    TitleUpdated,     // title
    FaviconUpdated,   // favicons, most preferred first
    FailedLoad,       // url, error_code, error_description, is_main_frame
    StopLoading,
    Crashed,
    Focused,
};

struct SurfaceEvent
{
    SurfaceEventType         type = SurfaceEventType::StartLoading;
    std::string              url;
    std::string              title;
    std::vector<std::string> favicons;
    int                      error_code = 0;
    std::string              error_description;
    bool                     is_main_frame  = true;
    bool                     can_go_back    = false;
    bool                     can_go_forward = false;
};

// Renderer error for a load that was superseded by another navigation.
inline constexpr int ERR_ABORTED = -3;

// RGBA8, row-major, width * height * 4 bytes.
struct Bitmap
{
    uint32_t             width  = 0;
    uint32_t             height = 0;
    std::vector<uint8_t> rgba;
};

// ─── Surface ─────────────────────────────────────────────────────────────────
// One out-of-process web rendering target.  Owned exclusively by the
// ViewRegistry; everything else refers to surfaces by (window, tab).

class Surface
{
   public:
    using EventHandler   = std::function<void(const SurfaceEvent&)>;
    using CaptureHandler = std::function<void(std::optional<Bitmap>)>;

    virtual ~Surface() = default;

    virtual void load_url(const std::string& url) = 0;
    virtual void go_back()                        = 0;
    virtual void go_forward()                     = 0;
    virtual void reload()                         = 0;
    virtual void stop()                           = 0;

    virtual std::string url() const            = 0;
    virtual bool        can_go_back() const    = 0;
    virtual bool        can_go_forward() const = 0;
    virtual bool        is_crashed() const     = 0;

    virtual void set_bounds(const Rect& bounds) = 0;
    virtual Rect bounds() const                 = 0;
    virtual void set_visible(bool visible)      = 0;
    virtual bool is_visible() const             = 0;
    virtual void focus()                        = 0;

    // Asynchronous: `done` runs exactly once, with nullopt on failure.
    virtual void capture(CaptureHandler done) = 0;

    void set_event_handler(EventHandler handler) { handler_ = std::move(handler); }

   protected:
    void emit(const SurfaceEvent& ev)
    {
        if (handler_)
            handler_(ev);
    }

   private:
    EventHandler handler_;
};

// ─── SurfaceHost ─────────────────────────────────────────────────────────────
// The host window's compositing tree.  Child order is paint order: the
// last attached child paints on top.  There is no way to move a child
// other than detaching it and attaching it again.

class SurfaceHost
{
   public:
    virtual ~SurfaceHost() = default;

    virtual std::unique_ptr<Surface> create_surface() = 0;

    // Appends on top.  Attaching an already attached surface is a no-op.
    virtual void attach(Surface* surface) = 0;
    virtual void detach(Surface* surface) = 0;

    // Bottom to top.
    virtual std::vector<Surface*> children() const = 0;

    bool is_attached(const Surface* surface) const
    {
        for (const Surface* s : children())
        {
            if (s == surface)
                return true;
        }
        return false;
    }
};

}   // namespace tessera::view
