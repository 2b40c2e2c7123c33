#include <headerpush/gateway/upstream.hpp>

#include <cctype>
#include <limits>
#include <memory>
#include <utility>

#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = net::ip::tcp;
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::uint64_t kMaxUpstreamBody = 64ull * 1024 * 1024;
        constexpr std::size_t kHashHexLength = 64;

        bool is_block_hash(const std::string &s)
        {
            if (s.size() != kHashHexLength)
                return false;
            for (const char c : s)
            {
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return false;
            }
            return true;
        }

        /// One GET over a dedicated connection. Keeps itself alive through
        /// the completion handlers it hands to Beast.
        class HttpFetch : public std::enable_shared_from_this<HttpFetch>
        {
        public:
            HttpFetch(net::io_context &ioc,
                      http::request<http::empty_body> req,
                      std::chrono::milliseconds timeout,
                      UpstreamClient::ReplyHandler handler)
                : resolver_(net::make_strand(ioc)),
                  stream_(resolver_.get_executor()),
                  req_(std::move(req)),
                  timeout_(timeout),
                  handler_(std::move(handler))
            {
                parser_.body_limit(kMaxUpstreamBody);
            }

            void run(const std::string &host, const std::string &port)
            {
                resolver_.async_resolve(
                    host,
                    port,
                    beast::bind_front_handler(&HttpFetch::on_resolve, shared_from_this()));
            }

        private:
            void arm_timeout()
            {
                if (timeout_.count() > 0)
                    stream_.expires_after(timeout_);
                else
                    stream_.expires_never();
            }

            void on_resolve(const boost::system::error_code &ec, tcp::resolver::results_type results)
            {
                if (ec)
                    return finish(FetchStatus::unavailable, ec);

                arm_timeout();
                stream_.async_connect(
                    results,
                    beast::bind_front_handler(&HttpFetch::on_connect, shared_from_this()));
            }

            void on_connect(const boost::system::error_code &ec, const tcp::endpoint &)
            {
                if (ec)
                    return finish(FetchStatus::unavailable, ec);

                arm_timeout();
                http::async_write(
                    stream_,
                    req_,
                    beast::bind_front_handler(&HttpFetch::on_write, shared_from_this()));
            }

            void on_write(const boost::system::error_code &ec, std::size_t)
            {
                if (ec)
                    return finish(FetchStatus::failed, ec);

                http::async_read(
                    stream_,
                    buffer_,
                    parser_,
                    beast::bind_front_handler(&HttpFetch::on_read, shared_from_this()));
            }

            void on_read(const boost::system::error_code &ec, std::size_t)
            {
                if (ec)
                    return finish(FetchStatus::failed, ec);

                auto res = parser_.release();

                UpstreamReply reply;
                reply.status = FetchStatus::ok;
                reply.code = res.result_int();
                reply.reason = std::string(res.reason());
                reply.contentType = std::string(res[http::field::content_type]);
                reply.body = std::move(res.body());

                boost::system::error_code ignore;
                stream_.socket().shutdown(tcp::socket::shutdown_both, ignore);

                deliver(std::move(reply));
            }

            void finish(FetchStatus status, const boost::system::error_code &ec)
            {
                logger.log(Logger::Level::DEBUG,
                           "[Gateway][Upstream] {} {} failed: {}",
                           std::string(req_.method_string()),
                           std::string(req_.target()),
                           ec.message());

                UpstreamReply reply;
                reply.status = status;
                reply.error = ec;
                deliver(std::move(reply));
            }

            void deliver(UpstreamReply reply)
            {
                if (handler_)
                {
                    auto handler = std::move(handler_);
                    handler(std::move(reply));
                }
            }

            tcp::resolver resolver_;
            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::empty_body> req_;
            http::response_parser<http::string_body> parser_;
            std::chrono::milliseconds timeout_;
            UpstreamClient::ReplyHandler handler_;
        };

        TipFetchStatus map_failure(const UpstreamReply &reply)
        {
            if (reply.status == FetchStatus::unavailable)
                return TipFetchStatus::unavailable;
            if (reply.status == FetchStatus::failed)
                return TipFetchStatus::failed;
            return TipFetchStatus::upstream_error;
        }

        std::string describe(const UpstreamReply &reply)
        {
            if (reply.status != FetchStatus::ok)
                return reply.error.message();
            return std::to_string(reply.code) + " " + reply.reason;
        }
    } // namespace

    const char *to_string(TipFetchStatus status) noexcept
    {
        switch (status)
        {
        case TipFetchStatus::ok:
            return "ok";
        case TipFetchStatus::unavailable:
            return "unavailable";
        case TipFetchStatus::upstream_error:
            return "upstream_error";
        case TipFetchStatus::integrity_error:
            return "integrity_error";
        case TipFetchStatus::failed:
            return "failed";
        }
        return "unknown";
    }

    bool select_longest_chain_tip(const std::string &tipsJson, Tip &out, std::string &detail)
    {
        auto tips = nlohmann::json::parse(tipsJson, nullptr, /*allow_exceptions=*/false);
        if (tips.is_discarded() || !tips.is_array())
        {
            detail = "chain tips response is not a JSON array";
            return false;
        }

        try
        {
            const nlohmann::json *longest = nullptr;
            std::size_t matches = 0;
            for (const auto &tip : tips)
            {
                if (tip.is_object() && tip.value("state", std::string{}) == "LONGEST_CHAIN")
                {
                    longest = &tip;
                    ++matches;
                }
            }

            if (matches != 1)
            {
                detail = "expected exactly one LONGEST_CHAIN tip, got " + std::to_string(matches);
                return false;
            }

            const auto &hash = longest->at("header").at("hash");
            const auto &height = longest->at("height");
            if (!hash.is_string() || !height.is_number_unsigned() ||
                height.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max())
            {
                detail = "LONGEST_CHAIN tip has a malformed hash or height";
                return false;
            }

            // The hash ends up in the next request target.
            if (!is_block_hash(hash.get<std::string>()))
            {
                detail = "LONGEST_CHAIN tip hash is not 64 hex characters";
                return false;
            }

            out.hash = hash.get<std::string>();
            out.height = static_cast<std::uint32_t>(height.get<std::uint64_t>());
            return true;
        }
        catch (const nlohmann::json::exception &e)
        {
            detail = std::string{"malformed chain tips entry: "} + e.what();
            return false;
        }
    }

    UpstreamClient::UpstreamClient(net::io_context &ioc, const Config &cfg)
        : ioc_(ioc),
          host_(cfg.upstreamHost),
          port_(cfg.upstreamPort),
          timeout_(cfg.upstreamTimeout),
          userAgent_(cfg.serverName)
    {
    }

    void UpstreamClient::get(std::string target,
                             http::field negotiation,
                             const char *mime,
                             ReplyHandler handler)
    {
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, endpoint());
        req.set(http::field::user_agent, userAgent_);
        req.set(http::field::connection, "close");
        req.set(negotiation, mime);

        logger.log(Logger::Level::DEBUG,
                   "[Gateway][Upstream] GET {} ({}: {})",
                   target, std::string(http::to_string(negotiation)), mime);

        auto done = [this, handler = std::move(handler)](UpstreamReply reply) mutable
        {
            if (reply.status == FetchStatus::unavailable)
                outageSeen_ = true;
            handler(std::move(reply));
        };

        std::make_shared<HttpFetch>(ioc_, std::move(req), timeout_, std::move(done))
            ->run(host_, port_);
    }

    void UpstreamClient::fetch_header(const std::string &hash, HeaderFormat format, ReplyHandler handler)
    {
        // HeaderSV negotiates this route on Content-Type rather than Accept.
        get("/api/v1/chain/header/" + hash,
            http::field::content_type,
            format == HeaderFormat::binary ? kMimeBinary : kMimeJson,
            std::move(handler));
    }

    void UpstreamClient::fetch_headers_by_height(const std::string &height,
                                                 const std::string &count,
                                                 HeaderFormat format,
                                                 ReplyHandler handler)
    {
        get("/api/v1/chain/header/byHeight?height=" + height + "&count=" + count,
            http::field::accept,
            format == HeaderFormat::binary ? kMimeBinary : kMimeJson,
            std::move(handler));
    }

    void UpstreamClient::fetch_chain_tips(ReplyHandler handler)
    {
        get("/api/v1/chain/tips", http::field::accept, kMimeJson, std::move(handler));
    }

    void UpstreamClient::fetch_peers(ReplyHandler handler)
    {
        get("/api/v1/network/peers", http::field::accept, kMimeJson, std::move(handler));
    }

    void UpstreamClient::fetch_current_tip(TipHandler handler)
    {
        fetch_chain_tips(
            [this, handler = std::move(handler)](UpstreamReply reply) mutable
            {
                on_tips(std::move(reply), std::move(handler));
            });
    }

    void UpstreamClient::on_tips(UpstreamReply reply, TipHandler handler)
    {
        TipResult result;

        if (!reply.is_success())
        {
            result.status = map_failure(reply);
            result.detail = "chain tips: " + describe(reply);
            return handler(std::move(result));
        }

        if (!select_longest_chain_tip(reply.body, result.tip, result.detail))
        {
            result.status = TipFetchStatus::integrity_error;
            return handler(std::move(result));
        }

        auto tip = std::move(result.tip);
        fetch_header(
            tip.hash,
            HeaderFormat::binary,
            [tip = std::move(tip), handler = std::move(handler)](UpstreamReply headerReply) mutable
            {
                TipResult out;
                if (!headerReply.is_success())
                {
                    out.status = map_failure(headerReply);
                    out.detail = "header " + tip.hash + ": " + describe(headerReply);
                    return handler(std::move(out));
                }

                tip.rawHeader = std::move(headerReply.body);
                out.status = TipFetchStatus::ok;
                out.tip = std::move(tip);
                handler(std::move(out));
            });
    }

} // namespace headerpush::gateway
