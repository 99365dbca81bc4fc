#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "surface_host.hpp"

namespace tessera::view
{

class HeadlessSurfaceHost;

// Surface without a renderer.  Keeps a navigation history and reports
// the same event sequence a real renderer would, delivered through the
// host's task queue so callers observe the in-between loading state.
class HeadlessSurface : public Surface
{
   public:
    enum class CaptureMode
    {
        Immediate,   // capture completes inside capture()
        Deferred,    // held until complete_capture()
        Fail,        // completes with nullopt
    };

    explicit HeadlessSurface(HeadlessSurfaceHost& host);
    ~HeadlessSurface() override;

    void load_url(const std::string& url) override;
    void go_back() override;
    void go_forward() override;
    void reload() override;
    void stop() override;

    std::string url() const override;
    bool        can_go_back() const override;
    bool        can_go_forward() const override;
    bool        is_crashed() const override { return crashed_; }

    void set_bounds(const Rect& bounds) override { bounds_ = bounds; }
    Rect bounds() const override { return bounds_; }
    void set_visible(bool visible) override { visible_ = visible; }
    bool is_visible() const override { return visible_; }
    void focus() override { ++focus_count_; }

    void capture(CaptureHandler done) override;

    // ─── Simulation hooks ────────────────────────────────────────────────
    void fail_next_load(int error_code, std::string description);
    void set_capture_mode(CaptureMode mode) { capture_mode_ = mode; }
    bool complete_capture(bool success);
    bool has_pending_capture() const { return static_cast<bool>(pending_capture_); }
    void simulate_crash();
    void simulate_user_focus();
    void simulate_title(const std::string& title);

    bool is_loading() const { return loading_; }
    int  focus_count() const { return focus_count_; }
    int  load_count() const { return load_count_; }

   private:
    void start_navigation(const std::string& url, bool push_history);
    void post(std::function<void()> task);
    std::optional<Bitmap> render() const;

    HeadlessSurfaceHost&     host_;
    std::shared_ptr<bool>    alive_ = std::make_shared<bool>(true);
    std::vector<std::string> history_;
    size_t                   index_       = 0;
    uint64_t                 generation_  = 0;
    bool                     loading_     = false;
    bool                     crashed_     = false;
    bool                     visible_     = true;
    int                      focus_count_ = 0;
    int                      load_count_  = 0;
    Rect                     bounds_;
    std::string              loading_url_;

    int         next_error_code_ = 0;
    std::string next_error_description_;

    CaptureMode    capture_mode_ = CaptureMode::Immediate;
    CaptureHandler pending_capture_;
};

class HeadlessSurfaceHost : public SurfaceHost
{
   public:
    std::unique_ptr<Surface> create_surface() override;

    void                  attach(Surface* surface) override;
    void                  detach(Surface* surface) override;
    std::vector<Surface*> children() const override { return children_; }

    void post(std::function<void()> task) { tasks_.push_back(std::move(task)); }

    // Runs queued renderer work.  Returns the number of tasks run.
    size_t pump();
    bool   pump_one();
    size_t pending_tasks() const { return tasks_.size(); }

    // Attach/detach calls since construction, for stacking assertions.
    size_t attach_count() const { return attach_count_; }
    size_t detach_count() const { return detach_count_; }
    size_t created_count() const { return created_count_; }

    void forget(Surface* surface);

   private:
    std::vector<Surface*>             children_;
    std::deque<std::function<void()>> tasks_;
    size_t                            attach_count_  = 0;
    size_t                            detach_count_  = 0;
    size_t                            created_count_ = 0;
};

}   // namespace tessera::view
