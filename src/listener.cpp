#include <headerpush/gateway/listener.hpp>

#include <algorithm>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    Listener::Listener(net::io_context &ioc, const Config &cfg, ConnectionHandler onConnection)
        : ioc_(ioc),
          configuredThreads_(cfg.ioThreads),
          onConnection_(std::move(onConnection)),
          acceptor_(nullptr),
          ioThreads_(),
          stopRequested_(false)
    {
        init_acceptor(cfg.address, cfg.port);
    }

    Listener::~Listener()
    {
        stop_and_join();
    }

    void Listener::init_acceptor(const std::string &address, unsigned short port)
    {
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        boost::system::error_code ec;

        auto ip = net::ip::make_address(address, ec);
        if (ec)
            throw std::system_error(ec, "listen address");

        tcp::endpoint endpoint(ip, port);
        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
            throw std::system_error(ec, "bind acceptor");

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        port_ = acceptor_->local_endpoint().port();

        logger.log(Logger::Level::INFO,
                   "[Gateway][Listener] Listening on {}:{}", address, port_);
    }

    void Listener::run()
    {
        start_accept();
        start_io_threads();
    }

    void Listener::start_accept()
    {
        acceptor_->async_accept(
            net::make_strand(ioc_),
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (stopRequested_)
                    return;

                if (!ec)
                {
                    onConnection_(std::move(socket));
                }
                else if (ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::WARN,
                               "[Gateway][Listener] Accept error: {}", ec.message());
                }

                start_accept();
            });
    }

    std::size_t Listener::compute_io_thread_count() const
    {
        if (configuredThreads_ > 0)
            return configuredThreads_;

        const unsigned int hc = std::thread::hardware_concurrency();
        const unsigned int v = (hc != 0u) ? (hc / 2u) : 1u;
        return static_cast<std::size_t>(std::max(1u, v));
    }

    void Listener::start_io_threads()
    {
        const std::size_t n = compute_io_thread_count();
        ioThreads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            ioThreads_.emplace_back([this, i]()
                                    {
        try
        {
            ioc_.run();
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Gateway][Listener] IO thread {} error: {}", i, e.what());
        }

        logger.log(Logger::Level::DEBUG,
                   "[Gateway][Listener] IO thread {} finished", i); });
        }

        logger.log(Logger::Level::INFO,
                   "[Gateway][Listener] {} IO thread(s) running", n);
    }

    void Listener::stop_accepting()
    {
        if (stopRequested_.exchange(true))
            return;

        net::post(ioc_, [this]()
                  {
            if (acceptor_ && acceptor_->is_open())
            {
                boost::system::error_code ec;
                acceptor_->close(ec);
            } });
    }

    void Listener::stop_and_join()
    {
        stopRequested_.store(true);
        ioc_.stop();

        for (auto &t : ioThreads_)
        {
            if (t.joinable())
                t.join();
        }
        ioThreads_.clear();
    }

} // namespace headerpush::gateway
