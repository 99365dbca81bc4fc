#pragma once

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/tab_state.hpp>

#include "../ipc/blob_store.hpp"

namespace tessera::view
{

class Surface;

// Captures the active surface of a window into a named blob and keeps
// the most recent captures per window, releasing older blobs as new
// ones arrive.
class SnapshotService
{
   public:
    using Handler = std::function<void(std::optional<ImageRef>)>;

    static constexpr size_t DEFAULT_MAX_PER_WINDOW = 10;

    explicit SnapshotService(ipc::BlobStore& blobs, size_t max_per_window = DEFAULT_MAX_PER_WINDOW);
    ~SnapshotService();

    SnapshotService(const SnapshotService&)            = delete;
    SnapshotService& operator=(const SnapshotService&) = delete;

    // `done` runs exactly once.  Null for sign-in pages, a missing or
    // crashed surface, and failed captures.
    void capture(WindowId window_id, Surface* surface, const std::string& url, Handler done);

    std::optional<ImageRef> latest(WindowId window_id) const;
    size_t                  count(WindowId window_id) const;
    size_t                  total_count() const;

    void clear_window(WindowId window_id);
    void clear_all();

   private:
    std::string next_blob_name(WindowId window_id);
    void        store(WindowId window_id, const ImageRef& image);

    ipc::BlobStore&                             blobs_;
    size_t                                      max_per_window_;
    std::map<WindowId, std::deque<ImageRef>>   snapshots_;   // oldest first
    uint64_t                                    counter_ = 0;
};

}   // namespace tessera::view
