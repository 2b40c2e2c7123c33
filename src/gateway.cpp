#include <headerpush/gateway/gateway.hpp>
#include <headerpush/gateway/http_session.hpp>

#include <chrono>
#include <csignal>
#include <thread>
#include <utility>

#include <boost/asio/signal_set.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::chrono::milliseconds kDrainTimeout{1000};
        constexpr std::chrono::milliseconds kDrainStep{10};
    } // namespace

    Gateway::Gateway(Config cfg)
        : cfg_(std::move(cfg)),
          metrics_(),
          registry_(),
          ioc_(),
          upstream_(std::make_unique<UpstreamClient>(ioc_, cfg_)),
          proxy_(std::make_unique<ProxyHandlers>(*upstream_, cfg_, metrics_)),
          broadcaster_(std::make_unique<TipBroadcaster>(registry_, metrics_)),
          watcher_(std::make_unique<TipWatcher>(ioc_, *upstream_, *broadcaster_, cfg_.tipPollInterval)),
          listener_(std::make_unique<Listener>(ioc_, cfg_,
                                               [this](tcp::socket socket)
                                               { on_connection(std::move(socket)); }))
    {
    }

    Gateway::Gateway(const vix::config::Config &core)
        : Gateway(Config::from_core(core))
    {
    }

    Gateway::~Gateway()
    {
        stop();
    }

    void Gateway::start()
    {
        if (started_.exchange(true))
            return;

        logger.log(Logger::Level::INFO,
                   "[Gateway][Server] Starting on port {} (ws path {}, upstream {})",
                   port(), cfg_.wsPath, upstream_->endpoint());

        listener_->run();
        watcher_->start();
    }

    void Gateway::stop()
    {
        if (stopped_.exchange(true))
            return;

        watcher_->stop();
        listener_->stop_accepting();

        if (started_)
        {
            const std::size_t closing = registry_.for_each(
                [](Connection &c)
                { c.close(); });

            if (closing > 0)
            {
                logger.log(Logger::Level::INFO,
                           "[Gateway][Server] Closing {} notification session(s)", closing);

                const auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
                while (registry_.size() > 0 && std::chrono::steady_clock::now() < deadline)
                    std::this_thread::sleep_for(kDrainStep);

                if (registry_.size() > 0)
                {
                    logger.log(Logger::Level::WARN,
                               "[Gateway][Server] {} session(s) still open at shutdown",
                               registry_.size());
                }
            }
        }

        listener_->stop_and_join();

        logger.log(Logger::Level::INFO, "[Gateway][Server] Stopped");
    }

    void Gateway::listen_blocking()
    {
        std::atomic<bool> signalled{false};

        net::signal_set signals(ioc_, SIGINT, SIGTERM);
        signals.async_wait(
            [&signalled](const boost::system::error_code &ec, int signo)
            {
                if (ec)
                    return;

                logger.log(Logger::Level::INFO,
                           "[Gateway][Server] Signal {} received, shutting down", signo);
                signalled = true;
            });

        start();

        while (!signalled && !listener_->is_stop_requested())
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        stop();
    }

    void Gateway::on_connection(tcp::socket socket)
    {
        std::make_shared<HttpSession>(std::move(socket),
                                      cfg_,
                                      registry_,
                                      *upstream_,
                                      *proxy_,
                                      metrics_)
            ->run();
    }

} // namespace headerpush::gateway
