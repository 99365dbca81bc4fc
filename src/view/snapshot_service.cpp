#include "snapshot_service.hpp"

#include <span>
#include <tessera/logger.hpp>
#include <unistd.h>

#include "../core/url.hpp"
#include "surface_host.hpp"

namespace tessera::view
{

SnapshotService::SnapshotService(ipc::BlobStore& blobs, size_t max_per_window)
    : blobs_(blobs), max_per_window_(max_per_window == 0 ? 1 : max_per_window)
{
}

SnapshotService::~SnapshotService()
{
    clear_all();
}

void SnapshotService::capture(WindowId           window_id,
                              Surface*           surface,
                              const std::string& url,
                              Handler            done)
{
    if (is_authentication_url(url))
    {
        TESSERA_LOG_DEBUG("snapshot", "Window {}: skipping capture of sign-in page", window_id);
        done(std::nullopt);
        return;
    }
    if (!surface || surface->is_crashed())
    {
        TESSERA_LOG_DEBUG("snapshot", "Window {}: no live surface to capture", window_id);
        done(std::nullopt);
        return;
    }

    surface->capture(
        [this, window_id, done = std::move(done)](std::optional<Bitmap> bitmap)
        {
            if (!bitmap || bitmap->rgba.empty())
            {
                TESSERA_LOG_WARN("snapshot", "Window {}: capture failed", window_id);
                done(std::nullopt);
                return;
            }

            ImageRef image{next_blob_name(window_id), bitmap->width, bitmap->height};
            if (!blobs_.publish(image.name, std::span<const uint8_t>(bitmap->rgba)))
            {
                TESSERA_LOG_ERROR("snapshot", "Window {}: cannot publish blob {}", window_id, image.name);
                done(std::nullopt);
                return;
            }
            store(window_id, image);
            TESSERA_LOG_DEBUG("snapshot",
                              "Window {}: captured {}x{} as {}",
                              window_id,
                              image.width,
                              image.height,
                              image.name);
            done(image);
        });
}

std::optional<ImageRef> SnapshotService::latest(WindowId window_id) const
{
    auto it = snapshots_.find(window_id);
    if (it == snapshots_.end() || it->second.empty())
        return std::nullopt;
    return it->second.back();
}

size_t SnapshotService::count(WindowId window_id) const
{
    auto it = snapshots_.find(window_id);
    return it == snapshots_.end() ? 0 : it->second.size();
}

size_t SnapshotService::total_count() const
{
    size_t n = 0;
    for (const auto& [id, list] : snapshots_)
        n += list.size();
    return n;
}

void SnapshotService::clear_window(WindowId window_id)
{
    auto it = snapshots_.find(window_id);
    if (it == snapshots_.end())
        return;
    for (const auto& image : it->second)
        blobs_.release(image.name);
    snapshots_.erase(it);
}

void SnapshotService::clear_all()
{
    for (const auto& [id, list] : snapshots_)
    {
        for (const auto& image : list)
            blobs_.release(image.name);
    }
    snapshots_.clear();
}

std::string SnapshotService::next_blob_name(WindowId window_id)
{
    return "/tessera-" + std::to_string(::getpid()) + "-" + std::to_string(window_id) + "-"
           + std::to_string(++counter_);
}

void SnapshotService::store(WindowId window_id, const ImageRef& image)
{
    auto& list = snapshots_[window_id];
    list.push_back(image);
    while (list.size() > max_per_window_)
    {
        blobs_.release(list.front().name);
        list.pop_front();
    }
}

}   // namespace tessera::view
