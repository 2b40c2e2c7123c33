#include <headerpush/gateway/tip_watcher.hpp>

#include <utility>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    TipWatcher::TipWatcher(net::io_context &ioc,
                           UpstreamClient &upstream,
                           TipBroadcaster &broadcaster,
                           std::chrono::milliseconds interval)
        : strand_(net::make_strand(ioc)),
          timer_(strand_),
          upstream_(upstream),
          broadcaster_(broadcaster),
          interval_(interval)
    {
    }

    void TipWatcher::start()
    {
        if (!enabled())
        {
            logger.log(Logger::Level::INFO, "[Gateway][TipWatcher] Disabled");
            return;
        }

        stopped_ = false;
        net::post(strand_, [this]()
                  { schedule(); });

        logger.log(Logger::Level::INFO,
                   "[Gateway][TipWatcher] Polling {} every {}ms",
                   upstream_.endpoint(), interval_.count());
    }

    void TipWatcher::stop()
    {
        if (stopped_.exchange(true))
            return;

        net::post(strand_, [this]()
                  {
            boost::system::error_code ec;
            timer_.cancel(ec); });
    }

    void TipWatcher::schedule()
    {
        if (stopped_)
            return;

        timer_.expires_after(interval_);
        timer_.async_wait(
            [this](const boost::system::error_code &ec)
            {
                on_timer(ec);
            });
    }

    void TipWatcher::on_timer(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || stopped_)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Gateway][TipWatcher] Timer error: {}", ec.message());
            schedule();
            return;
        }

        upstream_.fetch_current_tip(
            [this](TipResult result)
            {
                net::post(strand_, [this, result = std::move(result)]() mutable
                          { on_poll(std::move(result)); });
            });
    }

    void TipWatcher::on_poll(TipResult result)
    {
        if (stopped_)
            return;

        switch (result.status)
        {
        case TipFetchStatus::ok:
        {
            const bool changed = !last_ ||
                                 last_->hash != result.tip.hash ||
                                 last_->height != result.tip.height;

            // Also catches outages seen by sessions or the proxy between polls.
            const bool recovered = upstream_.consume_outage() || recovering_;

            if (recovered || (last_ && changed))
            {
                broadcaster_.broadcast(result.tip);
            }
            else if (!last_)
            {
                logger.log(Logger::Level::INFO,
                           "[Gateway][TipWatcher] Baseline tip height={} hash={}",
                           result.tip.height, result.tip.hash);
            }

            last_ = std::move(result.tip);
            recovering_ = false;
            break;
        }
        case TipFetchStatus::unavailable:
            if (!recovering_)
            {
                logger.log(Logger::Level::ERROR,
                           "[Gateway][TipWatcher] HeaderSV service is unavailable on {}",
                           upstream_.endpoint());
            }
            recovering_ = true;
            break;
        default:
            logger.log(Logger::Level::WARN,
                       "[Gateway][TipWatcher] Poll failed ({}): {}",
                       to_string(result.status), result.detail);
            break;
        }

        schedule();
    }

} // namespace headerpush::gateway
