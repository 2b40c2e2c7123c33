#ifndef HEADERPUSH_GATEWAY_NOTIFICATION_SESSION_HPP
#define HEADERPUSH_GATEWAY_NOTIFICATION_SESSION_HPP

/**
 * @file notification_session.hpp
 * @brief Per-connection tip notification WebSocket session.
 *
 * Responsibilities:
 *  - Complete the WebSocket upgrade of an already-read HTTP request.
 *  - Register in the ConnectionRegistry for the lifetime of the connection.
 *  - Push the current best tip once, then push every broadcast frame.
 *  - Read (and discard) client messages until the peer closes or errors.
 *  - Tear down exactly once: close the socket, then deregister.
 *
 * All handlers run on the strand the socket was accepted on.
 */

#include <atomic>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <headerpush/gateway/config.hpp>
#include <headerpush/gateway/connection.hpp>
#include <headerpush/gateway/metrics.hpp>
#include <headerpush/gateway/registry.hpp>
#include <headerpush/gateway/upstream.hpp>

namespace headerpush::gateway
{
    namespace beast = boost::beast;
    namespace ws = boost::beast::websocket;
    using tcp = net::ip::tcp;

    class NotificationSession : public Connection,
                                public std::enable_shared_from_this<NotificationSession>
    {
    public:
        enum class State
        {
            connecting,
            active,
            closing,
            closed
        };

        NotificationSession(tcp::socket socket,
                            const Config &cfg,
                            ConnectionRegistry &registry,
                            UpstreamClient &upstream,
                            GatewayMetrics &metrics);

        ~NotificationSession() override;

        /// Accept the upgrade carried by @p req, then run the session.
        void run(beast::http::request<beast::http::string_body> req);

        const std::string &id() const noexcept override { return id_; }

        /// Queue a binary frame (thread-safe via the session strand).
        void send_binary(std::string payload) override;

        /// Normal close handshake followed by teardown. Idempotent.
        void close() override;

        State state() const noexcept { return state_.load(); }

    private:
        void on_accept(const boost::system::error_code &ec);

        void send_initial_tip();
        void on_initial_tip(TipResult result);

        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void do_enqueue(std::string payload);
        void do_write_next();
        void on_write_complete(const boost::system::error_code &ec, std::size_t bytes);

        void do_close();
        void teardown(const char *reason);

    private:
        ws::stream<beast::tcp_stream> ws_;

        const Config &cfg_;
        ConnectionRegistry &registry_;
        UpstreamClient &upstream_;
        GatewayMetrics &metrics_;

        std::string id_;
        ConnectionRegistry::Registration registration_;
        std::atomic<State> state_{State::connecting};

        beast::flat_buffer buffer_;

        // Broadcast frames wait here until the initial tip has been handled.
        std::deque<std::string> writeQueue_;
        bool writeInProgress_ = false;
        bool initialPushPending_ = true;
        bool closeRequested_ = false;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_NOTIFICATION_SESSION_HPP
