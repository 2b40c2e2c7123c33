#ifndef HEADERPUSH_GATEWAY_HTTP_SESSION_HPP
#define HEADERPUSH_GATEWAY_HTTP_SESSION_HPP

/**
 * @file http_session.hpp
 * @brief Plain HTTP connection in front of the gateway.
 *
 * Reads requests one at a time and either:
 *  - hands the socket to a NotificationSession (WebSocket upgrade on the tips path),
 *  - serves `GET /metrics`,
 *  - or forwards to the ProxyHandlers.
 */

#include <chrono>
#include <memory>
#include <optional>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <headerpush/gateway/config.hpp>
#include <headerpush/gateway/metrics.hpp>
#include <headerpush/gateway/proxy.hpp>
#include <headerpush/gateway/registry.hpp>
#include <headerpush/gateway/upstream.hpp>

namespace headerpush::gateway
{
    namespace beast = boost::beast;
    using tcp = net::ip::tcp;

    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(tcp::socket socket,
                    const Config &cfg,
                    ConnectionRegistry &registry,
                    UpstreamClient &upstream,
                    ProxyHandlers &proxy,
                    GatewayMetrics &metrics);

        void run();

    private:
        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void dispatch(HttpRequest req);
        void do_write(HttpResponse res, unsigned version, bool keepAlive);
        void on_write(bool close, const boost::system::error_code &ec, std::size_t bytes);
        void do_shutdown();

    private:
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        std::shared_ptr<HttpResponse> res_;

        const Config &cfg_;
        ConnectionRegistry &registry_;
        UpstreamClient &upstream_;
        ProxyHandlers &proxy_;
        GatewayMetrics &metrics_;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_HTTP_SESSION_HPP
