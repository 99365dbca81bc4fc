#pragma once

#include <string>
#include <sys/types.h>

namespace tessera::ui
{

/**
 * ViewProcess — spawns and supervises the tessera-viewd child.
 *
 * The child is launched as `<binary> --socket <path>` and inherits the
 * environment.  The destructor terminates a child that is still running.
 */
class ViewProcess
{
   public:
    ViewProcess() = default;
    ~ViewProcess();

    ViewProcess(const ViewProcess&)            = delete;
    ViewProcess& operator=(const ViewProcess&) = delete;

    void               set_binary(const std::string& path) { binary_ = path; }
    const std::string& binary() const { return binary_; }

    void               set_socket_path(const std::string& path) { socket_path_ = path; }
    const std::string& socket_path() const { return socket_path_; }

    // Returns false if a child is already running, the binary or socket
    // path is unset, or posix_spawn fails.
    bool  spawn();
    pid_t pid() const { return pid_; }

    // Polls without blocking.  Collects the exit status once the child
    // has gone.
    bool is_running();

    // SIGTERM, then wait up to `grace_ms` before SIGKILL.
    void terminate(int grace_ms = 2000);

    // Exit code of the last child, or -1 if it was killed by a signal or
    // has not exited.
    int exit_code() const { return exit_code_; }

   private:
    void record_status(int status);

    std::string binary_;
    std::string socket_path_;
    pid_t       pid_       = 0;
    int         exit_code_ = -1;
};

// Path of tessera-viewd next to the running executable, falling back to
// the bare name (resolved through PATH by posix_spawnp).
std::string default_view_binary(const char* argv0);

}   // namespace tessera::ui
