// tessera-viewd: owns the browser surfaces and serves one workspace client
// over a Unix domain socket.  Exits when that client disconnects.

#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <poll.h>
#include <string>
#include <tessera/logger.hpp>

#include "../core/config.hpp"
#include "../ipc/blob_store.hpp"
#include "../ipc/port.hpp"
#include "../ipc/transport.hpp"
#include "headless_surface_host.hpp"
#include "view_service.hpp"

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0
              << " [--socket <path>] [--config <file>] [--log-level <level>] [--log-file <file>]\n";
}

}   // namespace

int main(int argc, char* argv[])
{
    auto cli = tessera::parse_command_line(argc, argv);
    if (!cli.ok || cli.show_help)
    {
        if (!cli.ok)
            std::cerr << "tessera-viewd: " << cli.error << "\n";
        print_usage(argv[0]);
        return cli.ok ? 0 : 2;
    }

    tessera::Config config = tessera::load_config(cli);
    tessera::configure_logging(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    tessera::ipc::Server server;
    if (!server.listen(config.socket_path))
    {
        TESSERA_LOG_CRITICAL("viewd", "Failed to listen on {}", config.socket_path);
        return 1;
    }
    TESSERA_LOG_INFO("viewd", "Listening on {}", config.socket_path);

    tessera::view::HeadlessSurfaceHost host;
    tessera::ipc::ShmBlobStore         blobs;
    tessera::view::ViewService         service(host, blobs, config);

    std::unique_ptr<tessera::ipc::SocketPort> client;
    bool                                      had_client = false;
    const int frame_ms = static_cast<int>(config.frame_interval_ms);

    while (g_running.load(std::memory_order_relaxed))
    {
        struct pollfd fds[2]{};
        nfds_t        nfds = 0;
        if (!client)
        {
            fds[nfds].fd     = server.listen_fd();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        else
        {
            fds[nfds].fd     = client->fd();
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        // Renderer work pending: do not sleep on the socket.
        int timeout = host.pending_tasks() > 0 ? 0 : frame_ms;
        int ret     = ::poll(fds, nfds, timeout);
        if (ret < 0 && errno != EINTR)
        {
            TESSERA_LOG_ERROR("viewd", "poll() failed: {}", std::strerror(errno));
            break;
        }

        if (!client)
        {
            if (auto conn = server.try_accept())
            {
                client = std::make_unique<tessera::ipc::SocketPort>(std::move(conn));
                service.attach(client.get());
                had_client = true;
                TESSERA_LOG_INFO("viewd", "Workspace connected");
            }
        }

        if (client)
        {
            service.poll();
            if (!client->is_open())
            {
                TESSERA_LOG_INFO("viewd", "Workspace disconnected, shutting down");
                service.attach(nullptr);
                client.reset();
                break;
            }
        }

        host.pump();
        service.tick(std::chrono::steady_clock::now());
    }

    if (!had_client)
        TESSERA_LOG_INFO("viewd", "Exiting without a client");
    server.close();
    return 0;
}
