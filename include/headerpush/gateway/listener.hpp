#ifndef HEADERPUSH_GATEWAY_LISTENER_HPP
#define HEADERPUSH_GATEWAY_LISTENER_HPP

/**
 * @file listener.hpp
 * @brief TCP acceptor and I/O thread pool of the gateway.
 *
 * This component:
 *  - binds and listens on the configured address/port
 *  - accepts each connection on its own strand
 *  - hands accepted sockets to the connection handler
 *  - runs the shared io_context on background threads
 */

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <headerpush/gateway/config.hpp>

namespace headerpush::gateway
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    class Listener
    {
    public:
        using ConnectionHandler = std::function<void(tcp::socket)>;

        /// Binds immediately. @throws std::system_error on open/bind/listen failure.
        Listener(net::io_context &ioc, const Config &cfg, ConnectionHandler onConnection);

        ~Listener();

        /// Start accepting connections and running the io_context on background threads.
        void run();

        /// Cooperative async stop of the acceptor (threads keep running).
        void stop_accepting();

        /// Stop the io_context and join all I/O threads.
        void stop_and_join();

        /// Actual bound port (useful when configured with port 0).
        unsigned short port() const noexcept { return port_; }

        bool is_stop_requested() const { return stopRequested_.load(); }

    private:
        void init_acceptor(const std::string &address, unsigned short port);
        void start_accept();
        void start_io_threads();

        std::size_t compute_io_thread_count() const;

    private:
        net::io_context &ioc_;
        std::size_t configuredThreads_;
        ConnectionHandler onConnection_;

        std::unique_ptr<tcp::acceptor> acceptor_;
        std::vector<std::thread> ioThreads_;
        unsigned short port_ = 0;

        std::atomic<bool> stopRequested_{false};
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_LISTENER_HPP
