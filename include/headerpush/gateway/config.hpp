#ifndef HEADERPUSH_GATEWAY_CONFIG_HPP
#define HEADERPUSH_GATEWAY_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Gateway-specific configuration for headerpush.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the listener, the sessions and the upstream client. Keeps all gateway
 * knobs in one place instead of scattering literals across the codebase.
 */

#include <cstddef>
#include <chrono>
#include <string>

#include <vix/config/Config.hpp>

namespace headerpush::gateway
{
    /**
     * @struct Config
     * @brief Tunables controlling the gateway.
     */
    struct Config
    {
        /// Address the listener binds to.
        std::string address = "0.0.0.0";

        /// Listening port (0 = pick an ephemeral port).
        unsigned short port = 9090;

        /// Number of I/O threads (0 = half the hardware threads, at least 1).
        std::size_t ioThreads = 0;

        /// HTTP path that upgrades to the tip notification WebSocket.
        std::string wsPath = "/api/v1/headers/tips/websocket";

        /// Value sent in the User-Agent / Server headers of proxied responses.
        std::string serverName = "HeaderPush-Gateway";

        /// Maximum accepted inbound WebSocket message size in bytes.
        std::size_t maxMessageSize = 64 * 1024; // 64 KiB

        /// Enable permessage-deflate compression if client supports it.
        bool enablePerMessageDeflate = true;

        /// Send keep-alive pings on idle sessions (closing peers that never
        /// answer) and count inbound control frames. When false, idle sessions
        /// are never timed out.
        bool autoPingPong = true;

        /// Header service location.
        std::string upstreamHost = "127.0.0.1";
        std::string upstreamPort = "8080";

        /// Per-request upstream timeout (0 = none).
        std::chrono::milliseconds upstreamTimeout{0};

        /// Interval between upstream tip polls (0 = watcher disabled).
        std::chrono::milliseconds tipPollInterval{5000};

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Expected keys (optional):
         *  - gateway.address, gateway.port, gateway.io_threads
         *  - gateway.ws_path, gateway.server_name
         *  - websocket.max_message_size (int, bytes)
         *  - websocket.enable_deflate   (bool)
         *  - websocket.auto_ping_pong   (bool)
         *  - headersv.host, headersv.port
         *  - headersv.timeout_ms, headersv.poll_interval_ms
         *
         * @throws std::invalid_argument if a port is out of range.
         */
        static Config from_core(const vix::config::Config &core);
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_CONFIG_HPP
