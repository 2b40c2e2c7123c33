#ifndef HEADERPUSH_GATEWAY_METRICS_HPP
#define HEADERPUSH_GATEWAY_METRICS_HPP

/**
 * @file metrics.hpp
 * @brief Lightweight Prometheus-style counters for the gateway.
 *
 * The gateway serves these on `GET /metrics` from the same listener as the
 * proxy routes and the WebSocket endpoint.
 */

#include <atomic>
#include <cstdint>
#include <string>

namespace headerpush::gateway
{
    /**
     * @struct GatewayMetrics
     * @brief Aggregated counters for gateway activity.
     *
     * All fields are 64-bit atomics and can be safely incremented from multiple
     * threads without external synchronization.
     */
    struct GatewayMetrics
    {
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> connections_active{0};
        std::atomic<std::uint64_t> client_messages_in_total{0};
        std::atomic<std::uint64_t> control_frames_in_total{0};
        std::atomic<std::uint64_t> tip_frames_out_total{0};
        std::atomic<std::uint64_t> broadcasts_total{0};
        std::atomic<std::uint64_t> proxy_requests_total{0};
        std::atomic<std::uint64_t> upstream_unavailable_total{0};
        std::atomic<std::uint64_t> errors_total{0};

        /**
         * @brief Render all counters in Prometheus text format (v0.0.4).
         *
         * Intended to be served as "text/plain; version=0.0.4".
         */
        [[nodiscard]] std::string render_prometheus() const;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_METRICS_HPP
