#include <headerpush/gateway/broadcaster.hpp>

#include <stdexcept>
#include <string>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    TipBroadcaster::TipBroadcaster(ConnectionRegistry &registry, GatewayMetrics &metrics)
        : registry_(registry), metrics_(metrics)
    {
    }

    std::size_t TipBroadcaster::broadcast(const Tip &tip)
    {
        std::string frame;
        try
        {
            frame = encode_tip_frame(tip);
        }
        catch (const std::invalid_argument &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Gateway][Broadcast] Dropping tip {}: {}", tip.hash, e.what());
            return 0;
        }

        const auto n = registry_.for_each(
            [&frame](Connection &c)
            {
                c.send_binary(frame);
            });

        metrics_.broadcasts_total.fetch_add(1, std::memory_order_relaxed);
        logger.log(Logger::Level::INFO,
                   "[Gateway][Broadcast] Tip height={} hash={} pushed to {} client(s)",
                   tip.height, tip.hash, n);
        return n;
    }

} // namespace headerpush::gateway
