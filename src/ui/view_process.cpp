#include "view_process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <spawn.h>
#include <sys/wait.h>
#include <tessera/logger.hpp>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace tessera::ui
{

ViewProcess::~ViewProcess()
{
    if (pid_ > 0)
        terminate();
}

bool ViewProcess::spawn()
{
    if (pid_ > 0 && is_running())
    {
        TESSERA_LOG_WARN("process", "tessera-viewd already running (pid {})", pid_);
        return false;
    }
    if (binary_.empty() || socket_path_.empty())
    {
        TESSERA_LOG_ERROR("process", "Cannot spawn the view process: binary or socket path unset");
        return false;
    }

    pid_t       pid    = 0;
    const char* argv[] = {binary_.c_str(), "--socket", socket_path_.c_str(), nullptr};

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    // A bare name is looked up on PATH.
    bool use_path = binary_.find('/') == std::string::npos;
    int  ret      = use_path ? posix_spawnp(&pid, binary_.c_str(), &actions, nullptr,
                                            const_cast<char* const*>(argv), environ)
                             : posix_spawn(&pid, binary_.c_str(), &actions, nullptr,
                                           const_cast<char* const*>(argv), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (ret != 0)
    {
        TESSERA_LOG_ERROR("process", "posix_spawn of {} failed: {}", binary_, std::strerror(ret));
        return false;
    }

    pid_       = pid;
    exit_code_ = -1;
    TESSERA_LOG_INFO("process", "Spawned {} pid={} socket={}", binary_, static_cast<int>(pid),
                     socket_path_);
    return true;
}

bool ViewProcess::is_running()
{
    if (pid_ <= 0)
        return false;

    int   status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0)
        return true;
    if (result == pid_)
        record_status(status);
    else
        TESSERA_LOG_WARN("process", "waitpid({}) failed: {}", static_cast<int>(pid_),
                         std::strerror(errno));
    pid_ = 0;
    return false;
}

void ViewProcess::terminate(int grace_ms)
{
    if (!is_running())
        return;

    ::kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (!is_running())
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    TESSERA_LOG_WARN("process", "pid {} ignored SIGTERM; killing", static_cast<int>(pid_));
    ::kill(pid_, SIGKILL);
    int status = 0;
    if (::waitpid(pid_, &status, 0) == pid_)
        record_status(status);
    pid_ = 0;
}

void ViewProcess::record_status(int status)
{
    if (WIFEXITED(status))
    {
        exit_code_ = WEXITSTATUS(status);
        TESSERA_LOG_INFO("process", "Reaped pid={} exit_code={}", static_cast<int>(pid_), exit_code_);
    }
    else if (WIFSIGNALED(status))
    {
        exit_code_ = -1;
        TESSERA_LOG_WARN("process", "Reaped pid={} signal={}", static_cast<int>(pid_),
                         WTERMSIG(status));
    }
}

std::string default_view_binary(const char* argv0)
{
    if (argv0)
    {
        std::error_code       ec;
        std::filesystem::path self = std::filesystem::canonical("/proc/self/exe", ec);
        if (ec)
            self = std::filesystem::path(argv0);
        auto sibling = self.parent_path() / "tessera-viewd";
        if (std::filesystem::exists(sibling, ec))
            return sibling.string();
    }
    return "tessera-viewd";
}

}   // namespace tessera::ui
