#include <headerpush/gateway/http_session.hpp>
#include <headerpush/gateway/notification_session.hpp>

#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::uint64_t kMaxRequestBody = 16 * 1024;
        constexpr std::chrono::seconds kIoTimeout{30};
    } // namespace

    HttpSession::HttpSession(tcp::socket socket,
                             const Config &cfg,
                             ConnectionRegistry &registry,
                             UpstreamClient &upstream,
                             ProxyHandlers &proxy,
                             GatewayMetrics &metrics)
        : stream_(std::move(socket)),
          cfg_(cfg),
          registry_(registry),
          upstream_(upstream),
          proxy_(proxy),
          metrics_(metrics)
    {
    }

    void HttpSession::run()
    {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

    void HttpSession::do_read()
    {
        parser_.emplace();
        parser_->body_limit(kMaxRequestBody);

        stream_.expires_after(kIoTimeout);

        http::async_read(
            stream_,
            buffer_,
            *parser_,
            beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void HttpSession::on_read(const boost::system::error_code &ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
            return do_shutdown();

        if (ec)
        {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout)
            {
                logger.log(Logger::Level::DEBUG,
                           "[Gateway][Http] Read error: {}", ec.message());
            }
            return;
        }

        dispatch(parser_->release());
    }

    void HttpSession::dispatch(HttpRequest req)
    {
        const std::string_view target{req.target().data(), req.target().size()};
        const std::string_view path = target_path(target);
        const unsigned version = req.version();
        const bool keepAlive = req.keep_alive();

        if (path == cfg_.wsPath)
        {
            if (beast::websocket::is_upgrade(req))
            {
                stream_.expires_never();
                std::make_shared<NotificationSession>(
                    stream_.release_socket(), cfg_, registry_, upstream_, metrics_)
                    ->run(std::move(req));
                return;
            }

            do_write(proxy_.make_response(http::status::bad_request,
                                          "400: Expected WebSocket upgrade"),
                     version, keepAlive);
            return;
        }

        if (path == "/metrics" && req.method() == http::verb::get)
        {
            auto res = proxy_.make_response(http::status::ok, metrics_.render_prometheus());
            res.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
            res.set(http::field::cache_control, "no-store");
            do_write(std::move(res), version, keepAlive);
            return;
        }

        auto self = shared_from_this();
        const bool routed = proxy_.handle(
            req,
            [self, version, keepAlive](HttpResponse res)
            {
                net::post(
                    self->stream_.get_executor(),
                    [self, res = std::move(res), version, keepAlive]() mutable
                    {
                        self->do_write(std::move(res), version, keepAlive);
                    });
            });

        if (!routed)
        {
            do_write(proxy_.make_response(http::status::not_found, "404: Not Found"),
                     version, keepAlive);
        }
    }

    void HttpSession::do_write(HttpResponse res, unsigned version, bool keepAlive)
    {
        res.version(version);
        res.keep_alive(keepAlive);
        res.prepare_payload();

        res_ = std::make_shared<HttpResponse>(std::move(res));

        stream_.expires_after(kIoTimeout);

        http::async_write(
            stream_,
            *res_,
            beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), res_->need_eof()));
    }

    void HttpSession::on_write(bool close, const boost::system::error_code &ec, std::size_t)
    {
        if (ec)
        {
            logger.log(Logger::Level::DEBUG,
                       "[Gateway][Http] Write error: {}", ec.message());
            return;
        }

        res_.reset();

        if (close)
            return do_shutdown();

        do_read();
    }

    void HttpSession::do_shutdown()
    {
        boost::system::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

} // namespace headerpush::gateway
