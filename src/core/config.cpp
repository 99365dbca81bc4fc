#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <unistd.h>

#include "json_util.hpp"

namespace tessera
{

namespace
{

std::string home_dir()
{
    const char* home = std::getenv("HOME");
    return home ? home : "/tmp";
}

std::string config_dir()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return std::string(xdg) + "/tessera";
    return home_dir() + "/.config/tessera";
}

std::string default_socket_path()
{
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    std::string dir     = (runtime && *runtime) ? runtime : "/tmp";
    return dir + "/tessera-" + std::to_string(::getpid()) + ".sock";
}

std::optional<uint32_t> parse_u32(const char* s)
{
    if (!s || !*s)
        return std::nullopt;
    char*         end = nullptr;
    unsigned long v   = std::strtoul(s, &end, 10);
    if (*end != '\0' || v > UINT32_MAX)
        return std::nullopt;
    return static_cast<uint32_t>(v);
}

void merge_u32(const std::string& json, const char* key, uint32_t& out)
{
    auto v = json::read_number(json, key);
    if (v && *v >= 0.0 && *v <= static_cast<double>(UINT32_MAX))
        out = static_cast<uint32_t>(*v);
}

}   // namespace

Config Config::defaults()
{
    Config cfg;
    cfg.socket_path = default_socket_path();
    cfg.state_dir   = config_dir() + "/state";
    return cfg;
}

std::string default_config_path()
{
    return config_dir() + "/config.json";
}

bool Config::merge_json(const std::string& json)
{
    auto first = json.find_first_not_of(" \t\n\r");
    if (first == std::string::npos || json[first] != '{')
        return false;

    merge_u32(json, "capture_timeout_ms", capture_timeout_ms);
    merge_u32(json, "frame_interval_ms", frame_interval_ms);
    merge_u32(json, "heartbeat_ms", heartbeat_ms);
    merge_u32(json, "request_timeout_ms", request_timeout_ms);
    merge_u32(json, "max_snapshots", max_snapshots);

    if (auto v = json::read_string(json, "default_new_tab_url"))
        default_new_tab_url = *v;
    if (auto v = json::read_string(json, "socket_path"))
        socket_path = *v;
    if (auto v = json::read_string(json, "state_dir"))
        state_dir = *v;
    if (auto v = json::read_string(json, "log_file"))
        log_file = *v;
    if (auto v = json::read_string(json, "log_level"))
    {
        if (auto lvl = Logger::level_from_string(*v))
            log_level = *lvl;
        else
            TESSERA_LOG_WARN("config", "Ignoring unknown log_level '{}'", *v);
    }
    return true;
}

bool Config::merge_file(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;

    std::ifstream file(path);
    if (!file)
    {
        TESSERA_LOG_WARN("config", "Cannot open config file {}", path);
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (!merge_json(ss.str()))
    {
        TESSERA_LOG_WARN("config", "Config file {} is not a JSON object", path);
        return false;
    }
    TESSERA_LOG_DEBUG("config", "Loaded config from {}", path);
    return true;
}

void Config::merge_env()
{
    if (const char* s = std::getenv("TESSERA_SOCKET"); s && *s)
        socket_path = s;

    if (const char* s = std::getenv("TESSERA_LOG_LEVEL"); s && *s)
    {
        if (auto lvl = Logger::level_from_string(s))
            log_level = *lvl;
        else
            TESSERA_LOG_WARN("config", "Ignoring TESSERA_LOG_LEVEL='{}'", s);
    }

    if (const char* s = std::getenv("TESSERA_CAPTURE_TIMEOUT_MS"))
    {
        if (auto v = parse_u32(s))
            capture_timeout_ms = *v;
        else
            TESSERA_LOG_WARN("config", "Ignoring TESSERA_CAPTURE_TIMEOUT_MS='{}'", s);
    }
}

std::string Config::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"capture_timeout_ms\": " << capture_timeout_ms << ",\n";
    os << "  \"frame_interval_ms\": " << frame_interval_ms << ",\n";
    os << "  \"heartbeat_ms\": " << heartbeat_ms << ",\n";
    os << "  \"request_timeout_ms\": " << request_timeout_ms << ",\n";
    os << "  \"max_snapshots\": " << max_snapshots << ",\n";
    os << "  \"default_new_tab_url\": \"" << json::escape(default_new_tab_url) << "\",\n";
    os << "  \"socket_path\": \"" << json::escape(socket_path) << "\",\n";
    os << "  \"state_dir\": \"" << json::escape(state_dir) << "\",\n";
    os << "  \"log_file\": \"" << json::escape(log_file) << "\",\n";
    os << "  \"log_level\": \"" << Logger::level_to_string(log_level) << "\"\n";
    os << "}\n";
    return os.str();
}

CommandLine parse_command_line(int argc, char** argv)
{
    CommandLine cli;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            cli.show_help = true;
            continue;
        }

        std::optional<std::string>* target = nullptr;
        if (arg == "--config")
            target = &cli.config_path;
        else if (arg == "--socket")
            target = &cli.socket_path;
        else if (arg == "--log-level")
            target = &cli.log_level;
        else if (arg == "--log-file")
            target = &cli.log_file;

        if (!target)
        {
            cli.ok    = false;
            cli.error = "unknown option: " + std::string(arg);
            return cli;
        }
        if (i + 1 >= argc)
        {
            cli.ok    = false;
            cli.error = "missing value for " + std::string(arg);
            return cli;
        }
        *target = argv[++i];
    }
    return cli;
}

Config load_config(const CommandLine& cli)
{
    Config cfg = Config::defaults();
    cfg.merge_file(cli.config_path.value_or(default_config_path()));
    cfg.merge_env();

    if (cli.socket_path)
        cfg.socket_path = *cli.socket_path;
    if (cli.log_file)
        cfg.log_file = *cli.log_file;
    if (cli.log_level)
    {
        if (auto lvl = Logger::level_from_string(*cli.log_level))
            cfg.log_level = *lvl;
        else
            TESSERA_LOG_WARN("config", "Ignoring --log-level '{}'", *cli.log_level);
    }
    return cfg;
}

void configure_logging(const Config& cfg)
{
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(cfg.log_level);
    logger.add_sink(sinks::console_sink());
    if (!cfg.log_file.empty())
        logger.add_sink(sinks::file_sink(cfg.log_file));
}

}   // namespace tessera
