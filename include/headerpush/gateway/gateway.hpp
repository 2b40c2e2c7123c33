#ifndef HEADERPUSH_GATEWAY_GATEWAY_HPP
#define HEADERPUSH_GATEWAY_GATEWAY_HPP

/**
 * @file gateway.hpp
 * @brief Top-level wiring of the header notification gateway.
 *
 * A Gateway owns the io_context and every long-lived component:
 *
 *   Listener -> HttpSession -> { NotificationSession | ProxyHandlers | /metrics }
 *   TipWatcher -> UpstreamClient, TipBroadcaster -> ConnectionRegistry
 *
 * The listening socket is bound at construction, so port() is valid before
 * start() (useful when the configured port is 0).
 */

#include <atomic>
#include <memory>

#include <boost/asio/io_context.hpp>

#include <vix/config/Config.hpp>

#include <headerpush/gateway/broadcaster.hpp>
#include <headerpush/gateway/config.hpp>
#include <headerpush/gateway/listener.hpp>
#include <headerpush/gateway/metrics.hpp>
#include <headerpush/gateway/proxy.hpp>
#include <headerpush/gateway/registry.hpp>
#include <headerpush/gateway/tip_watcher.hpp>
#include <headerpush/gateway/upstream.hpp>

namespace headerpush::gateway
{
    class Gateway
    {
    public:
        explicit Gateway(Config cfg);
        explicit Gateway(const vix::config::Config &core);
        ~Gateway();

        Gateway(const Gateway &) = delete;
        Gateway &operator=(const Gateway &) = delete;

        /// Start accepting connections, the I/O threads and the tip watcher.
        void start();

        /**
         * @brief Close every notification session, then stop the I/O threads.
         *
         * Sessions get up to one second to finish their close handshake.
         * Idempotent.
         */
        void stop();

        /// start(), then block until SIGINT/SIGTERM, then stop().
        void listen_blocking();

        unsigned short port() const noexcept { return listener_->port(); }

        const Config &config() const noexcept { return cfg_; }
        ConnectionRegistry &registry() noexcept { return registry_; }
        TipBroadcaster &broadcaster() noexcept { return *broadcaster_; }
        UpstreamClient &upstream() noexcept { return *upstream_; }
        GatewayMetrics &metrics() noexcept { return metrics_; }

    private:
        void on_connection(tcp::socket socket);

    private:
        // Declaration order is teardown order in reverse: sessions still
        // parked in the io_context reference the registry and the metrics.
        Config cfg_;
        GatewayMetrics metrics_;
        ConnectionRegistry registry_;
        net::io_context ioc_;

        std::unique_ptr<UpstreamClient> upstream_;
        std::unique_ptr<ProxyHandlers> proxy_;
        std::unique_ptr<TipBroadcaster> broadcaster_;
        std::unique_ptr<TipWatcher> watcher_;
        std::unique_ptr<Listener> listener_;

        std::atomic<bool> started_{false};
        std::atomic<bool> stopped_{false};
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_GATEWAY_HPP
