#include <headerpush/gateway/config.hpp>

#include <algorithm>
#include <stdexcept>

namespace headerpush::gateway
{
    namespace
    {
        int checked_port(int v, const char *key)
        {
            if (v < 0 || v > 65535)
                throw std::invalid_argument(std::string{"Invalid port for "} + key);
            return v;
        }
    } // namespace

    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("gateway.address"))
        {
            cfg.address = core.getString("gateway.address", cfg.address);
        }

        if (core.has("gateway.port"))
        {
            auto v = checked_port(core.getInt("gateway.port", cfg.port), "gateway.port");
            cfg.port = static_cast<unsigned short>(v);
        }

        if (core.has("gateway.io_threads"))
        {
            auto v = core.getInt("gateway.io_threads", 0);
            cfg.ioThreads = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("gateway.ws_path"))
        {
            cfg.wsPath = core.getString("gateway.ws_path", cfg.wsPath);
        }

        if (core.has("gateway.server_name"))
        {
            cfg.serverName = core.getString("gateway.server_name", cfg.serverName);
        }

        if (core.has("websocket.max_message_size"))
        {
            auto v = core.getInt("websocket.max_message_size", static_cast<int>(cfg.maxMessageSize));
            cfg.maxMessageSize = static_cast<std::size_t>(std::max(1024, v)); // min 1 KiB
        }

        if (core.has("websocket.enable_deflate"))
        {
            cfg.enablePerMessageDeflate = core.getBool("websocket.enable_deflate", cfg.enablePerMessageDeflate);
        }

        if (core.has("websocket.auto_ping_pong"))
        {
            cfg.autoPingPong = core.getBool("websocket.auto_ping_pong", cfg.autoPingPong);
        }

        if (core.has("headersv.host"))
        {
            cfg.upstreamHost = core.getString("headersv.host", cfg.upstreamHost);
        }

        if (core.has("headersv.port"))
        {
            auto v = checked_port(core.getInt("headersv.port", 8080), "headersv.port");
            cfg.upstreamPort = std::to_string(v);
        }

        if (core.has("headersv.timeout_ms"))
        {
            auto v = core.getInt("headersv.timeout_ms", 0);
            cfg.upstreamTimeout = std::chrono::milliseconds(std::max(0, v));
        }

        if (core.has("headersv.poll_interval_ms"))
        {
            auto v = core.getInt("headersv.poll_interval_ms",
                                 static_cast<int>(cfg.tipPollInterval.count()));
            if (v <= 0)
                cfg.tipPollInterval = std::chrono::milliseconds{0};
            else
                cfg.tipPollInterval = std::chrono::milliseconds(std::max(100, v)); // min 100ms
        }

        return cfg;
    }

} // namespace headerpush::gateway
