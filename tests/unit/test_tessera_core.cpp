#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <tessera/geometry.hpp>
#include <tessera/logger.hpp>
#include <tessera/tab_state.hpp>

#include "core/config.hpp"
#include "core/json_util.hpp"
#include "core/url.hpp"

using namespace tessera;

// ═══════════════════════════════════════════════════════════════════════════════
// Geometry
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Geometry, RoundRectFloorsOriginAndCeilsExtent)
{
    Rect r = round_rect({10.6, 10.4, 500.5, 400.9});
    EXPECT_EQ(r, (Rect{10, 10, 501, 401}));
}

TEST(Geometry, RoundRectIsNotNearestRounding)
{
    // Nearest rounding would give {11, 0, 500, 300}.
    Rect r = round_rect({10.9, 0.2, 500.2, 299.1});
    EXPECT_EQ(r, (Rect{10, 0, 501, 300}));
}

TEST(Geometry, RoundRectIgnoresArithmeticNoise)
{
    Rect r = round_rect({99.9999999999, 20.0, 500.0000000001, 300.0});
    EXPECT_EQ(r, (Rect{100, 20, 500, 300}));
}

TEST(Geometry, NegativeOriginIsKept)
{
    auto r = validate_rect({-12.5, -3.0, 100.0, 50.0});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->x, -13);
    EXPECT_EQ(r->y, -3);
}

TEST(Geometry, ValidateRejectsNegativeExtent)
{
    EXPECT_FALSE(validate_rect({0.0, 0.0, -1.0, 10.0}).has_value());
    EXPECT_FALSE(validate_rect({0.0, 0.0, 10.0, -0.5}).has_value());
}

TEST(Geometry, ValidateRejectsNonFinite)
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(validate_rect({nan, 0.0, 10.0, 10.0}).has_value());
    EXPECT_FALSE(validate_rect({0.0, 0.0, inf, 10.0}).has_value());
}

TEST(Geometry, ZeroExtentIsValidButEmpty)
{
    auto r = validate_rect({5.0, 5.0, 0.0, 0.0});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// URL normalization
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Url, BlankInputIsRejected)
{
    EXPECT_FALSE(normalize_url("").has_value());
    EXPECT_FALSE(normalize_url("   \t\n").has_value());
}

TEST(Url, SchemeIsKept)
{
    EXPECT_EQ(normalize_url("http://example.com"), "http://example.com");
    EXPECT_EQ(normalize_url("  https://are.na/x  "), "https://are.na/x");
    EXPECT_EQ(normalize_url("about:blank"), "about:blank");
    EXPECT_EQ(normalize_url("data:text/html,hi"), "data:text/html,hi");
}

TEST(Url, BareHostGetsHttps)
{
    EXPECT_EQ(normalize_url("example.com"), "https://example.com");
    EXPECT_EQ(normalize_url("are.na/explore?x=1"), "https://are.na/explore?x=1");
}

TEST(Url, LocalPathsBecomeFileUrls)
{
    EXPECT_EQ(normalize_url("/tmp/page.html"), "file:///tmp/page.html");
    EXPECT_EQ(normalize_url("C:\\docs\\a.html"), "file:///C:/docs/a.html");
}

TEST(Url, HomeRelativePathUsesHome)
{
    const char* home = std::getenv("HOME");
    std::string base = home ? home : "";
    EXPECT_EQ(normalize_url("~/notes.html"), "file://" + base + "/notes.html");
}

TEST(Url, AuthenticationPagesAreDetected)
{
    EXPECT_TRUE(is_authentication_url("https://accounts.google.com/o/oauth2/auth"));
    EXPECT_TRUE(is_authentication_url("https://github.com/login"));
    EXPECT_TRUE(is_authentication_url("https://example.com/users/signin"));
    EXPECT_TRUE(is_authentication_url("https://api.example.com/authorize?client_id=abc&x=1"));
    EXPECT_FALSE(is_authentication_url("https://www.are.na/explore"));
    EXPECT_FALSE(is_authentication_url("https://example.com/?q=scope"));
}

TEST(Url, Trim)
{
    EXPECT_EQ(trim("  a b  "), "a b");
    EXPECT_EQ(trim("\t\n"), "");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tab state
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TabState, DefaultTitleIsNewTab)
{
    TabState t;
    EXPECT_EQ(t.title, "New Tab");
    EXPECT_EQ(t.nav_seq, 0u);
}

TEST(TabState, ActiveTabLookup)
{
    BrowserState s;
    s.tabs.push_back(TabState{.id = 3, .url = "https://a"});
    s.tabs.push_back(TabState{.id = 7, .url = "https://b"});
    s.active_tab_id = 7;
    ASSERT_NE(s.active_tab(), nullptr);
    EXPECT_EQ(s.active_tab()->url, "https://b");
    EXPECT_EQ(s.find_tab(99), nullptr);
}

TEST(TabState, NavigationActionNames)
{
    EXPECT_EQ(parse_navigation_action("back"), NavigationAction::Back);
    EXPECT_EQ(parse_navigation_action("stop"), NavigationAction::Stop);
    EXPECT_FALSE(parse_navigation_action("sideways").has_value());
    EXPECT_STREQ(to_string(NavigationAction::Forward), "forward");
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON helpers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonUtil, EscapeUnescape)
{
    std::string raw = "a \"quoted\"\\ line\nnext\ttab";
    EXPECT_EQ(json::unescape(json::escape(raw)), raw);
}

TEST(JsonUtil, ReadScalars)
{
    std::string doc = R"({"name": "tab \"one\"", "count": 42, "ratio": -1.5, "on": true, "off": false})";
    EXPECT_EQ(json::read_string(doc, "name"), "tab \"one\"");
    EXPECT_EQ(json::read_number(doc, "count"), 42.0);
    EXPECT_EQ(json::read_number(doc, "ratio"), -1.5);
    EXPECT_EQ(json::read_bool(doc, "on"), true);
    EXPECT_EQ(json::read_bool(doc, "off"), false);
    EXPECT_FALSE(json::read_string(doc, "missing").has_value());
    EXPECT_FALSE(json::read_string(doc, "count").has_value());
}

TEST(JsonUtil, ObjectArrayAndStrip)
{
    std::string doc = R"({"tabs": [{"id": 1, "url": "a]"}, {"id": 2}], "id": 9})";
    auto        objs = json::read_object_array(doc, "tabs");
    ASSERT_EQ(objs.size(), 2u);
    EXPECT_EQ(json::read_number(objs[0], "id"), 1.0);
    EXPECT_EQ(json::read_string(objs[0], "url"), "a]");

    std::string stripped = json::strip_array(doc, "tabs");
    EXPECT_EQ(json::read_number(stripped, "id"), 9.0);
    EXPECT_TRUE(json::read_object_array(stripped, "tabs").empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Config
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Config, Defaults)
{
    Config cfg = Config::defaults();
    EXPECT_EQ(cfg.capture_timeout_ms, 5000u);
    EXPECT_EQ(cfg.frame_interval_ms, 16u);
    EXPECT_FALSE(cfg.socket_path.empty());
    EXPECT_FALSE(cfg.state_dir.empty());
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
}

TEST(Config, MergeJsonOverridesKnownKeys)
{
    Config cfg;
    ASSERT_TRUE(cfg.merge_json(R"({"capture_timeout_ms": 250, "default_new_tab_url": "about:blank",
                                   "log_level": "debug", "unknown": 1})"));
    EXPECT_EQ(cfg.capture_timeout_ms, 250u);
    EXPECT_EQ(cfg.default_new_tab_url, "about:blank");
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(Config, MergeJsonRejectsNonObject)
{
    Config cfg;
    EXPECT_FALSE(cfg.merge_json(""));
    EXPECT_FALSE(cfg.merge_json("[1, 2]"));
    EXPECT_EQ(cfg.capture_timeout_ms, 5000u);
}

TEST(Config, NegativeNumbersAreIgnored)
{
    Config cfg;
    ASSERT_TRUE(cfg.merge_json(R"({"frame_interval_ms": -5})"));
    EXPECT_EQ(cfg.frame_interval_ms, 16u);
}

TEST(Config, SerializeRoundTripsThroughMerge)
{
    Config a;
    a.capture_timeout_ms = 1234;
    a.state_dir          = "/tmp/tessera \"state\"";
    a.log_level          = LogLevel::Warning;

    Config b;
    ASSERT_TRUE(b.merge_json(a.serialize()));
    EXPECT_EQ(b.capture_timeout_ms, 1234u);
    EXPECT_EQ(b.state_dir, a.state_dir);
    EXPECT_EQ(b.log_level, LogLevel::Warning);
}

TEST(Config, MissingFileIsNotAnError)
{
    Config cfg;
    EXPECT_TRUE(cfg.merge_file("/nonexistent/tessera/config.json"));
}

TEST(Config, MergeFile)
{
    auto path = std::filesystem::temp_directory_path() / "tessera_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"max_snapshots": 3})";
    }
    Config cfg;
    EXPECT_TRUE(cfg.merge_file(path.string()));
    EXPECT_EQ(cfg.max_snapshots, 3u);
    std::filesystem::remove(path);
}

TEST(CommandLine, ParsesKnownFlags)
{
    const char* args[] = {"prog", "--socket", "/tmp/s.sock", "--log-level", "trace"};
    auto        cli    = parse_command_line(5, const_cast<char**>(args));
    ASSERT_TRUE(cli.ok);
    EXPECT_EQ(cli.socket_path, "/tmp/s.sock");
    EXPECT_EQ(cli.log_level, "trace");
}

TEST(CommandLine, RejectsUnknownFlag)
{
    const char* args[] = {"prog", "--bogus"};
    auto        cli    = parse_command_line(2, const_cast<char**>(args));
    EXPECT_FALSE(cli.ok);
    EXPECT_NE(cli.error.find("--bogus"), std::string::npos);
}

TEST(CommandLine, RejectsMissingValue)
{
    const char* args[] = {"prog", "--socket"};
    auto        cli    = parse_command_line(2, const_cast<char**>(args));
    EXPECT_FALSE(cli.ok);
}

TEST(CommandLine, FlagsWinOverFile)
{
    const char* args[] = {"prog", "--config", "/nonexistent.json", "--socket", "/tmp/flag.sock"};
    auto        cli    = parse_command_line(5, const_cast<char**>(args));
    Config      cfg    = load_config(cli);
    EXPECT_EQ(cfg.socket_path, "/tmp/flag.sock");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Logger
// ═══════════════════════════════════════════════════════════════════════════════

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        saved_level_ = logger.get_level();
        logger.clear_sinks();
        logger.add_sink(sinks::memory_sink(entries_));
        logger.set_level(LogLevel::Debug);
    }

    void TearDown() override
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    TESSERA_LOG_INFO("test", "window {} tab {} ok={} name={}", 3, 7u, true, std::string("x"));
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "window 3 tab 7 ok=true name=x");
    EXPECT_EQ(entries_[0].category, "test");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ArgumentContainingPlaceholderIsNotExpanded)
{
    TESSERA_LOG_INFO("test", "{} then {}", "{}", 2);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} then 2");
}

TEST_F(LoggerTest, FloatingPointArgumentsAreCompact)
{
    TESSERA_LOG_WARN("registry", "Rejected bounds for window {}: {}x{}", 4u, -1.0, 300.5);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "Rejected bounds for window 4: -1x300.5");
    EXPECT_EQ(entries_[0].category, "registry");
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
}

TEST_F(LoggerTest, LevelFilters)
{
    TESSERA_LOG_TRACE("test", "dropped");
    TESSERA_LOG_DEBUG("test", "kept");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");
}

TEST(LoggerLevels, ParseNames)
{
    EXPECT_EQ(Logger::level_from_string("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("Critical"), LogLevel::Critical);
    EXPECT_FALSE(Logger::level_from_string("loud").has_value());
    EXPECT_EQ(Logger::level_to_string(LogLevel::Error), "ERROR");
}
