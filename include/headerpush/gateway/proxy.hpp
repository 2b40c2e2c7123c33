#ifndef HEADERPUSH_GATEWAY_PROXY_HPP
#define HEADERPUSH_GATEWAY_PROXY_HPP

/**
 * @file proxy.hpp
 * @brief Pass-through REST routes in front of the header service.
 *
 * Routes (GET only):
 *
 *   /api/v1/headers/{hash}                     -> /api/v1/chain/header/{hash}
 *   /api/v1/headers/by-height?height=&count=   -> /api/v1/chain/header/byHeight
 *   /api/v1/headers/tips                       -> /api/v1/chain/tips
 *   /api/v1/network/peers                      -> /api/v1/network/peers
 *
 * `Accept: application/octet-stream` selects the binary representation on the
 * header routes, anything else gets JSON. Upstream statuses other than 200 are
 * relayed verbatim; an unreachable upstream becomes 503.
 *
 * Responses are handed to the Responder without version or keep-alive set;
 * the HTTP session finalizes them.
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

#include <headerpush/gateway/config.hpp>
#include <headerpush/gateway/metrics.hpp>
#include <headerpush/gateway/upstream.hpp>

namespace headerpush::gateway
{
    namespace http = boost::beast::http;

    using HttpRequest = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;

    /// Value of `key` in the query string of @p target, if present.
    std::optional<std::string> query_param(std::string_view target, std::string_view key);

    /// Path component of @p target (query string stripped).
    std::string_view target_path(std::string_view target) noexcept;

    class ProxyHandlers
    {
    public:
        using Responder = std::function<void(HttpResponse)>;

        ProxyHandlers(UpstreamClient &upstream, const Config &cfg, GatewayMetrics &metrics);

        /**
         * @brief Dispatch @p req to the matching route.
         * @return false if no route matches (nothing was sent to @p respond).
         */
        bool handle(const HttpRequest &req, Responder respond);

        void get_header(const HttpRequest &req, std::string_view hash, Responder respond);
        void get_headers_by_height(const HttpRequest &req, Responder respond);
        void get_chain_tips(const HttpRequest &req, Responder respond);
        void get_peers(const HttpRequest &req, Responder respond);

        /// Plain-text response with the common headers set.
        HttpResponse make_response(http::status status, std::string_view text) const;

    private:
        void relay(UpstreamReply reply, HeaderFormat format, const Responder &respond);

        UpstreamClient &upstream_;
        std::string serverName_;
        GatewayMetrics &metrics_;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_PROXY_HPP
