// Tests for Config::from_core

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <vix/config/Config.hpp>

#include <headerpush/gateway/config.hpp>

using namespace headerpush::gateway;
using namespace std::chrono_literals;

namespace
{
    /// Writes @p json to a temp file and loads it through the core config.
    Config load(const std::string &name, const std::string &json)
    {
        const auto path = std::filesystem::temp_directory_path() / ("headerpush_" + name + ".json");
        {
            std::ofstream out(path);
            out << json;
        }
        vix::config::Config core{path.string()};
        std::filesystem::remove(path);
        return Config::from_core(core);
    }
} // namespace

TEST_CASE("Config: defaults when no keys are present", "[config]")
{
    const Config cfg = load("defaults", "{}");

    CHECK(cfg.address == "0.0.0.0");
    CHECK(cfg.port == 9090);
    CHECK(cfg.ioThreads == 0);
    CHECK(cfg.wsPath == "/api/v1/headers/tips/websocket");
    CHECK(cfg.serverName == "HeaderPush-Gateway");
    CHECK(cfg.maxMessageSize == 64 * 1024);
    CHECK(cfg.enablePerMessageDeflate);
    CHECK(cfg.autoPingPong);
    CHECK(cfg.upstreamHost == "127.0.0.1");
    CHECK(cfg.upstreamPort == "8080");
    CHECK(cfg.upstreamTimeout == 0ms);
    CHECK(cfg.tipPollInterval == 5000ms);
}

TEST_CASE("Config: values are read from the core config", "[config]")
{
    const Config cfg = load("overrides", R"({
        "gateway":   { "address": "127.0.0.1", "port": 19090, "io_threads": 3,
                       "ws_path": "/ws", "server_name": "Test-Gateway" },
        "websocket": { "max_message_size": 4096, "enable_deflate": false,
                       "auto_ping_pong": false },
        "headersv":  { "host": "headers.local", "port": 18080,
                       "timeout_ms": 1500, "poll_interval_ms": 250 }
    })");

    CHECK(cfg.address == "127.0.0.1");
    CHECK(cfg.port == 19090);
    CHECK(cfg.ioThreads == 3);
    CHECK(cfg.wsPath == "/ws");
    CHECK(cfg.serverName == "Test-Gateway");
    CHECK(cfg.maxMessageSize == 4096);
    CHECK_FALSE(cfg.enablePerMessageDeflate);
    CHECK_FALSE(cfg.autoPingPong);
    CHECK(cfg.upstreamHost == "headers.local");
    CHECK(cfg.upstreamPort == "18080");
    CHECK(cfg.upstreamTimeout == 1500ms);
    CHECK(cfg.tipPollInterval == 250ms);
}

TEST_CASE("Config: limits are enforced", "[config]")
{
    SECTION("message size has a 1 KiB floor")
    {
        CHECK(load("small_msg", R"({"websocket":{"max_message_size":10}})").maxMessageSize == 1024);
    }

    SECTION("poll interval has a 100ms floor")
    {
        CHECK(load("fast_poll", R"({"headersv":{"poll_interval_ms":5}})").tipPollInterval == 100ms);
    }

    SECTION("non-positive poll interval disables the watcher")
    {
        CHECK(load("no_poll", R"({"headersv":{"poll_interval_ms":0}})").tipPollInterval == 0ms);
    }

    SECTION("out of range ports are rejected")
    {
        CHECK_THROWS_AS(load("bad_port", R"({"gateway":{"port":70000}})"), std::invalid_argument);
        CHECK_THROWS_AS(load("bad_upstream", R"({"headersv":{"port":-1}})"), std::invalid_argument);
    }
}
