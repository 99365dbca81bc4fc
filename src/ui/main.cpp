// tessera-workspace: the UI process.  Spawns tessera-viewd, restores the
// persisted window layout and drives the browser windows every frame.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <tessera/logger.hpp>
#include <thread>

#include "../core/config.hpp"
#include "../ipc/port.hpp"
#include "../ipc/transport.hpp"
#include "kv_store.hpp"
#include "view_client.hpp"
#include "view_process.hpp"
#include "workspace.hpp"

#ifdef TESSERA_USE_GLFW
    #include "glfw_host_window.hpp"
#endif

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

constexpr int CONNECT_ATTEMPTS = 50;
constexpr int CONNECT_RETRY_MS = 100;

}   // namespace

int main(int argc, char* argv[])
{
    auto cli = tessera::parse_command_line(argc, argv);
    if (!cli.ok || cli.show_help)
    {
        if (!cli.ok)
            std::cerr << "tessera-workspace: " << cli.error << "\n";
        print_usage(argv[0]);
        return cli.ok ? 0 : 2;
    }

    tessera::Config config = tessera::load_config(cli);
    tessera::configure_logging(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    tessera::ui::ViewProcess viewd;
    viewd.set_binary(tessera::ui::default_view_binary(argv[0]));
    viewd.set_socket_path(config.socket_path);
    if (!viewd.spawn())
        return 1;

    std::unique_ptr<tessera::ipc::Connection> conn;
    for (int attempt = 0; attempt < CONNECT_ATTEMPTS && !conn; ++attempt)
    {
        conn = tessera::ipc::Client::connect(config.socket_path);
        if (!conn)
        {
            if (!viewd.is_running())
            {
                TESSERA_LOG_CRITICAL("workspace", "tessera-viewd exited during startup (code {})",
                                     viewd.exit_code());
                return 1;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(CONNECT_RETRY_MS));
        }
    }
    if (!conn)
    {
        TESSERA_LOG_CRITICAL("workspace", "Could not connect to {}", config.socket_path);
        return 1;
    }

    tessera::ipc::SocketPort port(std::move(conn));
    tessera::ui::ViewClient  client(port, std::chrono::milliseconds(config.request_timeout_ms));
    if (!client.hello("tessera-workspace"))
    {
        TESSERA_LOG_CRITICAL("workspace", "Handshake could not be sent");
        return 1;
    }

    tessera::ui::FileKeyValueStore kv(config.state_dir);
    tessera::ui::Workspace         workspace(client, kv, config);

#ifdef TESSERA_USE_GLFW
    tessera::ui::GlfwHostWindow host;
    if (!host.init(1440, 900, "Tessera"))
        return 1;
    host.set_callbacks({
        [&workspace](int w, int h) { workspace.on_host_resized(w, h); },
        [&workspace](bool focused) { workspace.on_host_focus(focused); },
        []() { g_running.store(false, std::memory_order_relaxed); },
    });
#endif

    // Startup proceeds once the layout is back; an empty layout gets one
    // browser window.
    bool restored = false;
    workspace.restore(
        [&](bool ok)
        {
            restored = true;
            if (!ok)
                TESSERA_LOG_WARN("workspace", "Persisted layout unreadable; starting empty");
            if (workspace.store().count() == 0)
                workspace.open_browser({80.0, 60.0, 1024.0, 720.0}, config.default_new_tab_url);
        });

    const auto frame_interval = std::chrono::milliseconds(config.frame_interval_ms);
    int        exit_code      = 0;

    while (g_running.load(std::memory_order_relaxed))
    {
        auto frame_start = std::chrono::steady_clock::now();

#ifdef TESSERA_USE_GLFW
        host.poll_events();
        if (host.should_close())
            break;
#endif

        workspace.frame(frame_start);
        workspace.present();

        if (!client.is_connected())
        {
            TESSERA_LOG_ERROR("workspace", "View process connection closed");
            exit_code = 1;
            break;
        }
        if (!restored)
            TESSERA_LOG_TRACE("workspace", "Waiting for the persisted layout");

        auto elapsed = std::chrono::steady_clock::now() - frame_start;
        if (elapsed < frame_interval)
            std::this_thread::sleep_for(frame_interval - elapsed);
    }

    // Final layout write happens synchronously on the file store.
    bool saved = false;
    workspace.save([&saved](bool ok) { saved = ok; });
    if (!saved)
        TESSERA_LOG_WARN("workspace", "Layout was not saved on exit");

    port.close();
    viewd.terminate();
    return exit_code;
}
