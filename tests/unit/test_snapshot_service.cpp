#include <gtest/gtest.h>

#include <memory>
#include <optional>

#include "ipc/blob_store.hpp"
#include "view/headless_surface_host.hpp"
#include "view/snapshot_service.hpp"

using namespace tessera;
using namespace tessera::view;

namespace
{

class SnapshotServiceTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        owned_ = host_.create_surface();
        surface_ = static_cast<HeadlessSurface*>(owned_.get());
        surface_->set_bounds({0, 0, 4, 3});
        surface_->load_url("https://www.are.na");
        host_.pump();
    }

    std::optional<ImageRef> capture_now(WindowId window, const std::string& url)
    {
        std::optional<ImageRef> result;
        bool                    called = false;
        snapshots_.capture(window, surface_, url,
                           [&](std::optional<ImageRef> image)
                           {
                               called = true;
                               result = std::move(image);
                           });
        EXPECT_TRUE(called);
        return result;
    }

    ipc::MemoryBlobStore     blobs_;
    SnapshotService          snapshots_{blobs_, 3};
    HeadlessSurfaceHost      host_;
    std::unique_ptr<Surface> owned_;
    HeadlessSurface*         surface_ = nullptr;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Capture
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SnapshotServiceTest, CapturePublishesBlob)
{
    auto image = capture_now(1, "https://www.are.na");
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->width, 4u);
    EXPECT_EQ(image->height, 3u);
    EXPECT_EQ(image->name.rfind("/tessera-", 0), 0u);

    auto bytes = blobs_.read(image->name);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->size(), 4u * 3u * 4u);
    EXPECT_EQ((*bytes)[3], 0xFF);

    EXPECT_EQ(snapshots_.latest(1), image);
    EXPECT_EQ(snapshots_.count(1), 1u);
}

TEST_F(SnapshotServiceTest, BlobNamesAreUnique)
{
    auto a = capture_now(1, "https://www.are.na");
    auto b = capture_now(1, "https://www.are.na");
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->name, b->name);
    EXPECT_EQ(snapshots_.latest(1), b);
}

TEST_F(SnapshotServiceTest, OlderCapturesAreReleased)
{
    std::optional<ImageRef> first = capture_now(1, "https://www.are.na");
    for (int i = 0; i < 3; ++i)
        capture_now(1, "https://www.are.na");

    EXPECT_EQ(snapshots_.count(1), 3u);
    EXPECT_EQ(blobs_.active_count(), 3u);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(blobs_.read(first->name).has_value());
}

TEST_F(SnapshotServiceTest, LimitIsPerWindow)
{
    for (int i = 0; i < 3; ++i)
    {
        capture_now(1, "https://www.are.na");
        capture_now(2, "https://www.are.na");
    }
    EXPECT_EQ(snapshots_.count(1), 3u);
    EXPECT_EQ(snapshots_.count(2), 3u);
    EXPECT_EQ(snapshots_.total_count(), 6u);
}

TEST_F(SnapshotServiceTest, SignInPagesAreNeverCaptured)
{
    EXPECT_FALSE(capture_now(1, "https://accounts.google.com/o/oauth2/auth").has_value());
    EXPECT_FALSE(capture_now(1, "https://example.com/login?next=/").has_value());
    EXPECT_EQ(blobs_.active_count(), 0u);
    EXPECT_FALSE(snapshots_.latest(1).has_value());
}

TEST_F(SnapshotServiceTest, MissingSurface)
{
    bool                    called = false;
    std::optional<ImageRef> result = ImageRef{"x", 1, 1};
    snapshots_.capture(1, nullptr, "https://www.are.na",
                       [&](std::optional<ImageRef> image)
                       {
                           called = true;
                           result = image;
                       });
    EXPECT_TRUE(called);
    EXPECT_FALSE(result.has_value());
}

TEST_F(SnapshotServiceTest, CrashedSurface)
{
    surface_->simulate_crash();
    EXPECT_FALSE(capture_now(1, "https://www.are.na").has_value());
}

TEST_F(SnapshotServiceTest, EmptyBoundsFail)
{
    surface_->set_bounds({0, 0, 0, 0});
    EXPECT_FALSE(capture_now(1, "https://www.are.na").has_value());
    EXPECT_EQ(blobs_.active_count(), 0u);
}

TEST_F(SnapshotServiceTest, FailedCapture)
{
    surface_->set_capture_mode(HeadlessSurface::CaptureMode::Fail);
    EXPECT_FALSE(capture_now(1, "https://www.are.na").has_value());
}

TEST_F(SnapshotServiceTest, DeferredCaptureCompletesLater)
{
    surface_->set_capture_mode(HeadlessSurface::CaptureMode::Deferred);

    int                     calls = 0;
    std::optional<ImageRef> result;
    snapshots_.capture(7, surface_, "https://www.are.na",
                       [&](std::optional<ImageRef> image)
                       {
                           ++calls;
                           result = image;
                       });
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(surface_->has_pending_capture());

    ASSERT_TRUE(surface_->complete_capture(true));
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(snapshots_.latest(7), result);
    EXPECT_FALSE(surface_->complete_capture(true));
}

TEST_F(SnapshotServiceTest, DeferredCaptureFailure)
{
    surface_->set_capture_mode(HeadlessSurface::CaptureMode::Deferred);

    int                     calls = 0;
    std::optional<ImageRef> result = ImageRef{"stale", 1, 1};
    snapshots_.capture(7, surface_, "https://www.are.na",
                       [&](std::optional<ImageRef> image)
                       {
                           ++calls;
                           result = image;
                       });
    surface_->complete_capture(false);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(snapshots_.count(7), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cleanup
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SnapshotServiceTest, ClearWindowReleasesBlobs)
{
    capture_now(1, "https://www.are.na");
    capture_now(2, "https://www.are.na");
    snapshots_.clear_window(1);
    EXPECT_EQ(snapshots_.count(1), 0u);
    EXPECT_EQ(blobs_.active_count(), 1u);
    snapshots_.clear_window(99);
}

TEST(SnapshotService, DestructorReleasesEverything)
{
    ipc::MemoryBlobStore blobs;
    HeadlessSurfaceHost  host;
    auto                 surface = host.create_surface();
    surface->set_bounds({0, 0, 2, 2});
    {
        SnapshotService snapshots(blobs);
        snapshots.capture(1, surface.get(), "https://a", [](std::optional<ImageRef>) {});
        snapshots.capture(2, surface.get(), "https://b", [](std::optional<ImageRef>) {});
        EXPECT_EQ(blobs.active_count(), 2u);
    }
    EXPECT_EQ(blobs.active_count(), 0u);
}
