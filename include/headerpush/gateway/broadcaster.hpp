#ifndef HEADERPUSH_GATEWAY_BROADCASTER_HPP
#define HEADERPUSH_GATEWAY_BROADCASTER_HPP

#include <cstddef>

#include <headerpush/gateway/metrics.hpp>
#include <headerpush/gateway/registry.hpp>
#include <headerpush/gateway/tip.hpp>

namespace headerpush::gateway
{
    /**
     * @brief Fans a new best tip out to every registered connection.
     *
     * The frame is encoded once; each connection gets its own copy queued on
     * its strand. Safe to call from any thread.
     */
    class TipBroadcaster
    {
    public:
        TipBroadcaster(ConnectionRegistry &registry, GatewayMetrics &metrics);

        /// @return number of connections the frame was queued to (0 if the tip is malformed).
        std::size_t broadcast(const Tip &tip);

    private:
        ConnectionRegistry &registry_;
        GatewayMetrics &metrics_;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_BROADCASTER_HPP
