#include "headless_surface_host.hpp"

#include <algorithm>
#include <utility>

namespace tessera::view
{

namespace
{

// "https://www.are.na/explore" -> "www.are.na"
std::string title_for(const std::string& url)
{
    auto sep = url.find("://");
    if (sep == std::string::npos)
        return url;
    auto host_begin = sep + 3;
    auto host_end   = url.find_first_of("/?#", host_begin);
    std::string host =
        url.substr(host_begin, host_end == std::string::npos ? std::string::npos : host_end - host_begin);
    return host.empty() ? url : host;
}

std::string favicon_for(const std::string& url)
{
    auto sep = url.find("://");
    if (sep == std::string::npos)
        return {};
    auto path = url.find('/', sep + 3);
    return url.substr(0, path) + "/favicon.ico";
}

}   // namespace

// ─── HeadlessSurface ─────────────────────────────────────────────────────────

HeadlessSurface::HeadlessSurface(HeadlessSurfaceHost& host) : host_(host) {}

HeadlessSurface::~HeadlessSurface()
{
    host_.forget(this);
}

void HeadlessSurface::post(std::function<void()> task)
{
    std::weak_ptr<bool> alive = alive_;
    host_.post(
        [alive, task = std::move(task)]()
        {
            if (alive.lock())
                task();
        });
}

void HeadlessSurface::load_url(const std::string& url)
{
    start_navigation(url, true);
}

void HeadlessSurface::go_back()
{
    if (!can_go_back() || crashed_)
        return;
    --index_;
    start_navigation(history_[index_], false);
}

void HeadlessSurface::go_forward()
{
    if (!can_go_forward() || crashed_)
        return;
    ++index_;
    start_navigation(history_[index_], false);
}

void HeadlessSurface::reload()
{
    if (history_.empty() || crashed_)
        return;
    start_navigation(history_[index_], false);
}

void HeadlessSurface::stop()
{
    if (!loading_)
        return;
    ++generation_;
    loading_ = false;
    post([this]() { emit(SurfaceEvent{.type = SurfaceEventType::StopLoading}); });
}

std::string HeadlessSurface::url() const
{
    return history_.empty() ? std::string() : history_[index_];
}

bool HeadlessSurface::can_go_back() const
{
    return !history_.empty() && index_ > 0;
}

bool HeadlessSurface::can_go_forward() const
{
    return !history_.empty() && index_ + 1 < history_.size();
}

void HeadlessSurface::start_navigation(const std::string& url, bool push_history)
{
    if (crashed_)
        return;

    ++load_count_;
    uint64_t    gen        = ++generation_;
    bool        superseded = loading_;
    std::string previous   = loading_url_;

    if (push_history)
    {
        if (!history_.empty())
            history_.resize(index_ + 1);
        history_.push_back(url);
        index_ = history_.size() - 1;
    }
    loading_     = true;
    loading_url_ = url;

    int         error_code = next_error_code_;
    std::string error_desc = std::move(next_error_description_);
    next_error_code_       = 0;
    next_error_description_.clear();

    post(
        [this, superseded, previous]()
        {
            if (superseded)
            {
                emit(SurfaceEvent{.type              = SurfaceEventType::FailedLoad,
                                  .url               = previous,
                                  .error_code        = ERR_ABORTED,
                                  .error_description = "ERR_ABORTED"});
            }
            emit(SurfaceEvent{.type = SurfaceEventType::StartLoading});
        });

    post(
        [this, gen, url, error_code, error_desc]()
        {
            if (gen != generation_)
                return;
            loading_ = false;
            if (error_code != 0)
            {
                emit(SurfaceEvent{.type              = SurfaceEventType::FailedLoad,
                                  .url               = url,
                                  .error_code        = error_code,
                                  .error_description = error_desc});
                emit(SurfaceEvent{.type = SurfaceEventType::StopLoading});
                return;
            }
            emit(SurfaceEvent{.type           = SurfaceEventType::Navigated,
                              .url            = url,
                              .can_go_back    = can_go_back(),
                              .can_go_forward = can_go_forward()});
            emit(SurfaceEvent{.type = SurfaceEventType::TitleUpdated, .title = title_for(url)});
            std::string favicon = favicon_for(url);
            if (!favicon.empty())
                emit(SurfaceEvent{.type = SurfaceEventType::FaviconUpdated, .favicons = {favicon}});
            emit(SurfaceEvent{.type = SurfaceEventType::StopLoading});
        });
}

std::optional<Bitmap> HeadlessSurface::render() const
{
    if (bounds_.empty() || crashed_)
        return std::nullopt;

    Bitmap bmp;
    bmp.width  = static_cast<uint32_t>(bounds_.width);
    bmp.height = static_cast<uint32_t>(bounds_.height);
    bmp.rgba.resize(static_cast<size_t>(bmp.width) * bmp.height * 4);

    size_t  h     = std::hash<std::string>{}(url());
    uint8_t r     = static_cast<uint8_t>(h & 0xFF);
    uint8_t g     = static_cast<uint8_t>((h >> 8) & 0xFF);
    uint8_t b     = static_cast<uint8_t>((h >> 16) & 0xFF);
    for (size_t i = 0; i < bmp.rgba.size(); i += 4)
    {
        bmp.rgba[i]     = r;
        bmp.rgba[i + 1] = g;
        bmp.rgba[i + 2] = b;
        bmp.rgba[i + 3] = 0xFF;
    }
    return bmp;
}

void HeadlessSurface::capture(CaptureHandler done)
{
    if (crashed_ || capture_mode_ == CaptureMode::Fail)
    {
        done(std::nullopt);
        return;
    }
    if (capture_mode_ == CaptureMode::Deferred)
    {
        if (pending_capture_)
            std::exchange(pending_capture_, nullptr)(std::nullopt);
        pending_capture_ = std::move(done);
        return;
    }
    done(render());
}

bool HeadlessSurface::complete_capture(bool success)
{
    if (!pending_capture_)
        return false;
    auto done = std::exchange(pending_capture_, nullptr);
    done(success ? render() : std::nullopt);
    return true;
}

void HeadlessSurface::fail_next_load(int error_code, std::string description)
{
    next_error_code_        = error_code;
    next_error_description_ = std::move(description);
}

void HeadlessSurface::simulate_crash()
{
    crashed_ = true;
    loading_ = false;
    ++generation_;
    if (pending_capture_)
        std::exchange(pending_capture_, nullptr)(std::nullopt);
    emit(SurfaceEvent{.type = SurfaceEventType::Crashed});
}

void HeadlessSurface::simulate_user_focus()
{
    ++focus_count_;
    emit(SurfaceEvent{.type = SurfaceEventType::Focused});
}

void HeadlessSurface::simulate_title(const std::string& title)
{
    emit(SurfaceEvent{.type = SurfaceEventType::TitleUpdated, .title = title});
}

// ─── HeadlessSurfaceHost ─────────────────────────────────────────────────────

std::unique_ptr<Surface> HeadlessSurfaceHost::create_surface()
{
    ++created_count_;
    return std::make_unique<HeadlessSurface>(*this);
}

void HeadlessSurfaceHost::attach(Surface* surface)
{
    if (std::find(children_.begin(), children_.end(), surface) != children_.end())
        return;
    children_.push_back(surface);
    ++attach_count_;
}

void HeadlessSurfaceHost::detach(Surface* surface)
{
    auto it = std::find(children_.begin(), children_.end(), surface);
    if (it == children_.end())
        return;
    children_.erase(it);
    ++detach_count_;
}

void HeadlessSurfaceHost::forget(Surface* surface)
{
    std::erase(children_, surface);
}

size_t HeadlessSurfaceHost::pump()
{
    size_t ran = 0;
    while (pump_one())
        ++ran;
    return ran;
}

bool HeadlessSurfaceHost::pump_one()
{
    if (tasks_.empty())
        return false;
    auto task = std::move(tasks_.front());
    tasks_.pop_front();
    task();
    return true;
}

}   // namespace tessera::view
