#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "ui/view_process.hpp"

using namespace tessera::ui;

TEST(ViewProcess, DefaultState)
{
    ViewProcess vp;
    EXPECT_EQ(vp.pid(), 0);
    EXPECT_FALSE(vp.is_running());
    EXPECT_TRUE(vp.binary().empty());
    EXPECT_EQ(vp.exit_code(), -1);
}

TEST(ViewProcess, SpawnFailsWithoutPaths)
{
    ViewProcess vp;
    EXPECT_FALSE(vp.spawn());
    vp.set_binary("/bin/true");
    EXPECT_FALSE(vp.spawn());
    EXPECT_EQ(vp.pid(), 0);
}

TEST(ViewProcess, SpawnFailsWithBadPath)
{
    ViewProcess vp;
    vp.set_binary("/nonexistent/tessera-viewd-fake");
    vp.set_socket_path("/tmp/tessera-test.sock");
    EXPECT_FALSE(vp.spawn());
    EXPECT_EQ(vp.pid(), 0);
}

TEST(ViewProcess, TerminateWithoutChild)
{
    ViewProcess vp;
    vp.terminate();   // no child, nothing to do
    EXPECT_EQ(vp.pid(), 0);
}

TEST(ViewProcess, DefaultBinaryWithoutArgv0)
{
    std::string path = default_view_binary(nullptr);
    EXPECT_EQ(path, "tessera-viewd");
}

#ifdef __linux__

TEST(ViewProcess, ReapsExitedChild)
{
    ViewProcess vp;
    vp.set_binary("/bin/true");
    vp.set_socket_path("/tmp/tessera-test-dummy.sock");
    ASSERT_TRUE(vp.spawn());
    EXPECT_GT(vp.pid(), 0);

    for (int i = 0; i < 100 && vp.is_running(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_FALSE(vp.is_running());
    EXPECT_EQ(vp.exit_code(), 0);
    EXPECT_EQ(vp.pid(), 0);
}

TEST(ViewProcess, NonZeroExitCode)
{
    ViewProcess vp;
    vp.set_binary("/bin/false");
    vp.set_socket_path("/tmp/tessera-test-dummy.sock");
    ASSERT_TRUE(vp.spawn());
    for (int i = 0; i < 100 && vp.is_running(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(vp.exit_code(), 1);
}

TEST(ViewProcess, TerminateReapsChild)
{
    ViewProcess vp;
    vp.set_binary("/bin/cat");
    vp.set_socket_path("/dev/zero");
    ASSERT_TRUE(vp.spawn());
    vp.terminate(500);
    EXPECT_FALSE(vp.is_running());
    EXPECT_EQ(vp.pid(), 0);
}

TEST(ViewProcess, SpawnThroughPath)
{
    ViewProcess vp;
    vp.set_binary("true");
    vp.set_socket_path("/tmp/tessera-test-dummy.sock");
    ASSERT_TRUE(vp.spawn());
    for (int i = 0; i < 100 && vp.is_running(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(vp.exit_code(), 0);
}

#endif   // __linux__
