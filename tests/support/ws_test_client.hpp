#ifndef HEADERPUSH_TESTS_WS_TEST_CLIENT_HPP
#define HEADERPUSH_TESTS_WS_TEST_CLIENT_HPP

// Blocking WebSocket client with bounded reads, plus small polling helpers.
//
// A read that times out leaves its async_read outstanding; the next read()
// keeps waiting on the same operation, so no frame is lost and the stream is
// never cancelled mid-read.

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace headerpush::test
{
    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace ws = beast::websocket;
    using tcp = net::ip::tcp;

    using namespace std::chrono_literals;

    inline bool wait_until(const std::function<bool()> &pred,
                           std::chrono::milliseconds timeout = 3000ms)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred())
                return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }

    class WsTestClient
    {
    public:
        WsTestClient(unsigned short port, const std::string &path)
            : ws_(ioc_)
        {
            tcp::resolver resolver(ioc_);
            auto results = resolver.resolve("127.0.0.1", std::to_string(port));
            beast::get_lowest_layer(ws_).connect(results);
            ws_.handshake("127.0.0.1:" + std::to_string(port), path);
        }

        ~WsTestClient()
        {
            boost::system::error_code ec;
            beast::get_lowest_layer(ws_).socket().close(ec);
        }

        /// Next message, or nullopt on timeout or error (see last_error()).
        std::optional<std::string> read(std::chrono::milliseconds timeout = 2000ms)
        {
            if (!pending_)
            {
                pending_ = true;
                done_ = false;
                buffer_.clear();
                ws_.async_read(buffer_,
                               [this](const boost::system::error_code &ec, std::size_t)
                               {
                                   error_ = ec;
                                   done_ = true;
                               });
            }

            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (!done_ && std::chrono::steady_clock::now() < deadline)
            {
                if (ioc_.stopped())
                    ioc_.restart();
                ioc_.run_one_until(deadline);
            }

            if (!done_)
                return std::nullopt;

            pending_ = false;
            if (error_)
                return std::nullopt;

            return beast::buffers_to_string(buffer_.data());
        }

        bool last_was_binary() const { return ws_.got_binary(); }

        const boost::system::error_code &last_error() const { return error_; }

        void write_text(const std::string &text)
        {
            ws_.text(true);
            ws_.write(net::buffer(text));
        }

        void write_binary(const std::string &bytes)
        {
            ws_.binary(true);
            ws_.write(net::buffer(bytes));
        }

        void ping()
        {
            ws_.ping({});
        }

        /// Close handshake. Only valid while no read is outstanding.
        void close()
        {
            ws_.close(ws::close_code::normal);
        }

    private:
        net::io_context ioc_;
        ws::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        bool pending_ = false;
        bool done_ = false;
        boost::system::error_code error_;
    };

    /// One-shot HTTP/1.1 GET against the gateway.
    inline beast::http::response<beast::http::string_body>
    http_get(unsigned short port,
             const std::string &target,
             const std::string &accept = "",
             beast::http::verb verb = beast::http::verb::get)
    {
        namespace http = beast::http;

        net::io_context ioc;
        beast::tcp_stream stream(ioc);
        tcp::resolver resolver(ioc);
        stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.set(http::field::connection, "close");
        if (!accept.empty())
            req.set(http::field::accept, accept);
        req.prepare_payload();
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

} // namespace headerpush::test

#endif // HEADERPUSH_TESTS_WS_TEST_CLIENT_HPP
