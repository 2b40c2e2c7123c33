#ifndef HEADERPUSH_GATEWAY_TIP_WATCHER_HPP
#define HEADERPUSH_GATEWAY_TIP_WATCHER_HPP

/**
 * @file tip_watcher.hpp
 * @brief Periodic upstream tip poll driving the broadcaster.
 *
 * The first successful poll records a baseline. A broadcast is
 * triggered when the best tip changes, or when the header service was found
 * unreachable by any request since the previous successful poll (clients that
 * connected during the outage got no initial frame).
 */

#include <atomic>
#include <chrono>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <headerpush/gateway/broadcaster.hpp>
#include <headerpush/gateway/upstream.hpp>

namespace headerpush::gateway
{
    class TipWatcher
    {
    public:
        TipWatcher(net::io_context &ioc,
                   UpstreamClient &upstream,
                   TipBroadcaster &broadcaster,
                   std::chrono::milliseconds interval);

        /// No-op when the interval is zero.
        void start();
        void stop();

        bool enabled() const noexcept { return interval_.count() > 0; }

    private:
        void schedule();
        void on_timer(const boost::system::error_code &ec);
        void on_poll(TipResult result);

        net::strand<net::io_context::executor_type> strand_;
        net::steady_timer timer_;
        UpstreamClient &upstream_;
        TipBroadcaster &broadcaster_;
        std::chrono::milliseconds interval_;

        std::atomic<bool> stopped_{true};
        std::optional<Tip> last_;
        bool recovering_ = false;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_TIP_WATCHER_HPP
