#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tessera/logger.hpp>

namespace tessera
{

// Runtime tunables shared by tessera-viewd and tessera-workspace.
//
// Precedence, lowest to highest: built-in defaults, config.json,
// environment (TESSERA_SOCKET, TESSERA_LOG_LEVEL, TESSERA_CAPTURE_TIMEOUT_MS),
// command line (--socket, --config, --log-level).
struct Config
{
    uint32_t    capture_timeout_ms  = 5000;
    uint32_t    frame_interval_ms   = 16;
    uint32_t    heartbeat_ms        = 5000;
    uint32_t    request_timeout_ms  = 10000;
    uint32_t    max_snapshots       = 10;
    std::string default_new_tab_url = "https://www.are.na";
    std::string socket_path;
    std::string state_dir;   // one file per persisted-layout key
    std::string log_file;
    LogLevel    log_level = LogLevel::Info;

    // Defaults with socket_path and state_dir resolved for this user.
    static Config defaults();

    // Merge fields present in a config.json document.  Returns false if
    // the document is empty or not an object; unknown keys are ignored.
    bool merge_json(const std::string& json);

    // Reads `path` and merges it.  A missing file is not an error.
    bool merge_file(const std::string& path);

    void merge_env();

    std::string serialize() const;
};

// Result of command-line parsing.  `ok` is false on an unknown flag or a
// flag missing its value; `error` then holds a one-line message.
struct CommandLine
{
    bool                       ok = true;
    bool                       show_help = false;
    std::string                error;
    std::optional<std::string> config_path;
    std::optional<std::string> socket_path;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
};

CommandLine parse_command_line(int argc, char** argv);

// defaults → file (--config or ~/.config/tessera/config.json) → env → flags.
Config load_config(const CommandLine& cli);

std::string default_config_path();

// Installs the console sink (and a file sink when configured) and sets
// the global level.
void configure_logging(const Config& cfg);

}   // namespace tessera
