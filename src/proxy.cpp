#include <headerpush/gateway/proxy.hpp>

#include <utility>

#include <nlohmann/json.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::string_view kHeadersPrefix = "/api/v1/headers/";
        constexpr std::string_view kTipsPath = "/api/v1/headers/tips";
        constexpr std::string_view kByHeightPath = "/api/v1/headers/by-height";
        constexpr std::string_view kPeersPath = "/api/v1/network/peers";

        HeaderFormat requested_format(const HttpRequest &req)
        {
            return req[http::field::accept] == kMimeBinary ? HeaderFormat::binary
                                                           : HeaderFormat::json;
        }
    } // namespace

    std::optional<std::string> query_param(std::string_view target, std::string_view key)
    {
        auto pos = target.find('?');
        if (pos == std::string_view::npos)
            return std::nullopt;

        std::string_view query = target.substr(pos + 1);
        std::size_t start = 0;

        while (start <= query.size())
        {
            auto amp = query.find('&', start);
            auto part = query.substr(
                start,
                (amp == std::string_view::npos) ? std::string_view::npos : (amp - start));

            auto eq = part.find('=');
            if (eq != std::string_view::npos && part.substr(0, eq) == key)
                return std::string(part.substr(eq + 1));

            if (amp == std::string_view::npos)
                break;
            start = amp + 1;
        }
        return std::nullopt;
    }

    std::string_view target_path(std::string_view target) noexcept
    {
        return target.substr(0, target.find('?'));
    }

    ProxyHandlers::ProxyHandlers(UpstreamClient &upstream, const Config &cfg, GatewayMetrics &metrics)
        : upstream_(upstream), serverName_(cfg.serverName), metrics_(metrics)
    {
    }

    HttpResponse ProxyHandlers::make_response(http::status status, std::string_view text) const
    {
        HttpResponse res{status, 11};
        res.set(http::field::server, serverName_);
        res.set(http::field::user_agent, serverName_);
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.body() = std::string(text);
        return res;
    }

    bool ProxyHandlers::handle(const HttpRequest &req, Responder respond)
    {
        const std::string_view target{req.target().data(), req.target().size()};
        const std::string_view path = target_path(target);

        bool matched = path == kTipsPath || path == kByHeightPath || path == kPeersPath ||
                       (path.substr(0, kHeadersPrefix.size()) == kHeadersPrefix &&
                        path.find('/', kHeadersPrefix.size()) == std::string_view::npos);
        if (!matched)
            return false;

        if (req.method() != http::verb::get)
        {
            respond(make_response(http::status::method_not_allowed, "405: Method Not Allowed"));
            return true;
        }

        metrics_.proxy_requests_total.fetch_add(1, std::memory_order_relaxed);

        if (path == kTipsPath)
            get_chain_tips(req, std::move(respond));
        else if (path == kByHeightPath)
            get_headers_by_height(req, std::move(respond));
        else if (path == kPeersPath)
            get_peers(req, std::move(respond));
        else
            get_header(req, path.substr(kHeadersPrefix.size()), std::move(respond));

        return true;
    }

    void ProxyHandlers::get_header(const HttpRequest &req, std::string_view hash, Responder respond)
    {
        if (hash.empty())
        {
            auto res = make_response(http::status::bad_request,
                                     "400: 'hash' path parameter not supplied");
            res.reason("'hash' path parameter not supplied");
            respond(std::move(res));
            return;
        }

        const auto format = requested_format(req);
        upstream_.fetch_header(
            std::string(hash),
            format,
            [this, format, respond = std::move(respond)](UpstreamReply reply)
            {
                relay(std::move(reply), format, respond);
            });
    }

    void ProxyHandlers::get_headers_by_height(const HttpRequest &req, Responder respond)
    {
        const std::string_view target{req.target().data(), req.target().size()};
        const auto height = query_param(target, "height").value_or("0");
        const auto count = query_param(target, "count").value_or("1");
        const auto format = requested_format(req);

        upstream_.fetch_headers_by_height(
            height,
            count,
            format,
            [this, format, respond = std::move(respond)](UpstreamReply reply)
            {
                relay(std::move(reply), format, respond);
            });
    }

    void ProxyHandlers::get_chain_tips(const HttpRequest &, Responder respond)
    {
        upstream_.fetch_chain_tips(
            [this, respond = std::move(respond)](UpstreamReply reply)
            {
                relay(std::move(reply), HeaderFormat::json, respond);
            });
    }

    void ProxyHandlers::get_peers(const HttpRequest &, Responder respond)
    {
        upstream_.fetch_peers(
            [this, respond = std::move(respond)](UpstreamReply reply)
            {
                relay(std::move(reply), HeaderFormat::json, respond);
            });
    }

    void ProxyHandlers::relay(UpstreamReply reply, HeaderFormat format, const Responder &respond)
    {
        if (reply.status == FetchStatus::unavailable)
        {
            metrics_.upstream_unavailable_total.fetch_add(1, std::memory_order_relaxed);
            logger.log(Logger::Level::ERROR,
                       "[Gateway][Proxy] HeaderSV service is unavailable on {}",
                       upstream_.endpoint());
            respond(make_response(http::status::service_unavailable, "503: Service Unavailable"));
            return;
        }

        if (reply.status == FetchStatus::failed)
        {
            logger.log(Logger::Level::WARN,
                       "[Gateway][Proxy] Upstream request failed: {}",
                       reply.error.message());
            respond(make_response(http::status::bad_gateway, "502: Bad Gateway"));
            return;
        }

        if (reply.code != 200)
        {
            HttpResponse res{http::status::ok, 11};
            res.result(reply.code);
            res.reason(reply.reason);
            res.set(http::field::server, serverName_);
            res.set(http::field::user_agent, serverName_);
            respond(std::move(res));
            return;
        }

        HttpResponse res{http::status::ok, 11};
        res.set(http::field::server, serverName_);
        res.set(http::field::user_agent, serverName_);

        if (format == HeaderFormat::binary)
        {
            res.set(http::field::content_type, kMimeBinary);
            res.body() = std::move(reply.body);
            respond(std::move(res));
            return;
        }

        auto body = nlohmann::json::parse(reply.body, nullptr, /*allow_exceptions=*/false);
        if (body.is_discarded())
        {
            logger.log(Logger::Level::WARN,
                       "[Gateway][Proxy] Upstream returned a malformed JSON body ({} bytes)",
                       reply.body.size());
            respond(make_response(http::status::bad_gateway, "502: Bad Gateway"));
            return;
        }

        res.set(http::field::content_type, "application/json; charset=utf-8");
        res.body() = body.dump();
        respond(std::move(res));
    }

} // namespace headerpush::gateway
