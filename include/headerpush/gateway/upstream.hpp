#ifndef HEADERPUSH_GATEWAY_UPSTREAM_HPP
#define HEADERPUSH_GATEWAY_UPSTREAM_HPP

/**
 * @file upstream.hpp
 * @brief Asynchronous HTTP client for the header service (HeaderSV API).
 *
 * Responsibilities:
 *  - Issue one GET per call over a fresh connection (Connection: close).
 *  - Classify connectivity failures: anything failing before the TCP
 *    connection is established is reported as FetchStatus::unavailable.
 *  - Hand back non-success HTTP statuses untouched so callers can relay them.
 *  - Resolve the current best tip (tips query + raw header by hash).
 *
 * Completion handlers run on an I/O thread of the io_context passed at
 * construction. The client may be shared; its only mutable state is the
 * outage flag read by consume_outage().
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/system/error_code.hpp>

#include <headerpush/gateway/config.hpp>
#include <headerpush/gateway/tip.hpp>

namespace headerpush::gateway
{
    namespace net = boost::asio;

    inline constexpr const char *kMimeJson = "application/json";
    inline constexpr const char *kMimeBinary = "application/octet-stream";

    enum class HeaderFormat
    {
        json,
        binary
    };

    enum class FetchStatus
    {
        ok,          ///< a response was received (any HTTP status)
        unavailable, ///< resolve/connect failed: upstream unreachable
        failed       ///< transport error after the connection was established
    };

    struct UpstreamReply
    {
        FetchStatus status = FetchStatus::failed;
        unsigned code = 0;
        std::string reason;
        std::string body;
        std::string contentType;
        boost::system::error_code error;

        bool is_success() const noexcept
        {
            return status == FetchStatus::ok && code == 200;
        }
    };

    enum class TipFetchStatus
    {
        ok,
        unavailable,
        upstream_error,  ///< upstream answered with a non-200 status
        integrity_error, ///< zero or several LONGEST_CHAIN tips, or malformed JSON
        failed           ///< transport error mid-request
    };

    struct TipResult
    {
        TipFetchStatus status = TipFetchStatus::failed;
        Tip tip;
        std::string detail;
    };

    const char *to_string(TipFetchStatus status) noexcept;

    /**
     * @brief Pick the single LONGEST_CHAIN entry out of a /chain/tips body.
     *
     * On success @p out receives the hash and height (rawHeader stays empty).
     * Returns false with a reason in @p detail otherwise.
     */
    bool select_longest_chain_tip(const std::string &tipsJson, Tip &out, std::string &detail);

    class UpstreamClient
    {
    public:
        using ReplyHandler = std::function<void(UpstreamReply)>;
        using TipHandler = std::function<void(TipResult)>;

        UpstreamClient(net::io_context &ioc, const Config &cfg);

        /// GET /api/v1/chain/header/{hash}
        void fetch_header(const std::string &hash, HeaderFormat format, ReplyHandler handler);

        /// GET /api/v1/chain/header/byHeight?height=&count=
        void fetch_headers_by_height(const std::string &height,
                                     const std::string &count,
                                     HeaderFormat format,
                                     ReplyHandler handler);

        /// GET /api/v1/chain/tips
        void fetch_chain_tips(ReplyHandler handler);

        /// GET /api/v1/network/peers
        void fetch_peers(ReplyHandler handler);

        /// Tips query followed by a raw header fetch for the longest chain tip.
        void fetch_current_tip(TipHandler handler);

        /// "host:port", for log messages.
        std::string endpoint() const { return host_ + ":" + port_; }

        /// True if any request since the last call found the upstream
        /// unreachable. Clears the flag.
        bool consume_outage() noexcept { return outageSeen_.exchange(false); }

    private:
        void get(std::string target,
                 boost::beast::http::field negotiation,
                 const char *mime,
                 ReplyHandler handler);

        void on_tips(UpstreamReply reply, TipHandler handler);

        net::io_context &ioc_;
        std::string host_;
        std::string port_;
        std::chrono::milliseconds timeout_;
        std::string userAgent_;

        std::atomic<bool> outageSeen_{false};
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_UPSTREAM_HPP
