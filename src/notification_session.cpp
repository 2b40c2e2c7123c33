#include <headerpush/gateway/notification_session.hpp>

#include <stdexcept>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <vix/utils/Logger.hpp>

namespace headerpush::gateway
{
    namespace http = beast::http;
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    NotificationSession::NotificationSession(tcp::socket socket,
                                             const Config &cfg,
                                             ConnectionRegistry &registry,
                                             UpstreamClient &upstream,
                                             GatewayMetrics &metrics)
        : ws_(std::move(socket)),
          cfg_(cfg),
          registry_(registry),
          upstream_(upstream),
          metrics_(metrics)
    {
        {
            boost::system::error_code ec;
            beast::get_lowest_layer(ws_).socket().set_option(tcp::no_delay(true), ec);
        }

        ws_.read_message_max(cfg_.maxMessageSize);

        // On: keep-alive pings, peers that stop answering are dropped.
        // Off: no pings and no idle timeout.
        auto timeouts = ws::stream_base::timeout::suggested(beast::role_type::server);
        timeouts.keep_alive_pings = cfg_.autoPingPong;
        if (!cfg_.autoPingPong)
            timeouts.idle_timeout = ws::stream_base::none();
        ws_.set_option(timeouts);

        ws_.set_option(ws::stream_base::decorator(
            [name = cfg_.serverName](ws::response_type &res)
            {
                res.set(http::field::server, name);
            }));

        if (cfg_.enablePerMessageDeflate)
        {
            ws::permessage_deflate pmd;
            pmd.server_enable = true;
            ws_.set_option(pmd);
        }

        if (cfg_.autoPingPong)
        {
            // Beast answers pings itself; this only accounts for them.
            ws_.control_callback(
                [&metrics = metrics_](ws::frame_type kind, beast::string_view payload)
                {
                    metrics.control_frames_in_total.fetch_add(1, std::memory_order_relaxed);
                    logger.log(Logger::Level::DEBUG,
                               "[Gateway][Session] Control frame {} ({} bytes)",
                               kind == ws::frame_type::ping   ? "ping"
                               : kind == ws::frame_type::pong ? "pong"
                                                              : "close",
                               payload.size());
                });
        }
    }

    NotificationSession::~NotificationSession()
    {
        if (registration_.active())
        {
            registration_.reset();
            metrics_.connections_active.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    void NotificationSession::run(http::request<http::string_body> req)
    {
        logger.log(Logger::Level::DEBUG, "[Gateway][Session] Starting handshake");

        auto self = shared_from_this();
        net::dispatch(
            ws_.get_executor(),
            [self, req = std::move(req)]() mutable
            {
                self->ws_.async_accept(
                    req,
                    [self](const boost::system::error_code &ec)
                    {
                        self->on_accept(ec);
                    });
            });
    }

    void NotificationSession::on_accept(const boost::system::error_code &ec)
    {
        if (ec)
        {
            logger.log(Logger::Level::ERROR,
                       "[Gateway][Session] Accept failed: {}", ec.message());
            teardown("handshake failed");
            return;
        }

        id_ = boost::uuids::to_string(boost::uuids::random_generator()());

        try
        {
            registration_ = registry_.enroll(shared_from_this());
        }
        catch (const std::invalid_argument &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Gateway][Session] Registration failed: {}", e.what());
            teardown("registration failed");
            return;
        }

        metrics_.connections_total.fetch_add(1, std::memory_order_relaxed);
        metrics_.connections_active.fetch_add(1, std::memory_order_relaxed);

        state_ = State::active;
        ws_.binary(true);

        boost::system::error_code epec;
        auto remote = beast::get_lowest_layer(ws_).socket().remote_endpoint(epec);
        logger.log(Logger::Level::INFO,
                   "[Gateway][Session] {} connected, remote={}",
                   id_, epec ? std::string{"?"} : remote.address().to_string());

        if (closeRequested_)
        {
            do_close();
            return;
        }

        send_initial_tip();
        do_read();
    }

    void NotificationSession::send_initial_tip()
    {
        auto self = shared_from_this();

        upstream_.fetch_current_tip(
            [self](TipResult result)
            {
                net::post(
                    self->ws_.get_executor(),
                    [self, result = std::move(result)]() mutable
                    {
                        self->on_initial_tip(std::move(result));
                    });
            });
    }

    void NotificationSession::on_initial_tip(TipResult result)
    {
        if (state_ != State::active)
            return;

        switch (result.status)
        {
        case TipFetchStatus::ok:
        {
            std::string frame;
            try
            {
                frame = encode_tip_frame(result.tip);
            }
            catch (const std::invalid_argument &e)
            {
                logger.log(Logger::Level::ERROR,
                           "[Gateway][Session] {} cannot encode tip {}: {}",
                           id_, result.tip.hash, e.what());
                metrics_.errors_total.fetch_add(1, std::memory_order_relaxed);
                teardown("tip encode failed");
                return;
            }

            logger.log(Logger::Level::DEBUG,
                       "[Gateway][Session] Sending tip height={} to new websocket connection {}",
                       result.tip.height, id_);
            writeQueue_.push_front(std::move(frame));
            break;
        }
        case TipFetchStatus::unavailable:
            // The tip watcher sends a compensating notification once HeaderSV is back.
            metrics_.upstream_unavailable_total.fetch_add(1, std::memory_order_relaxed);
            logger.log(Logger::Level::ERROR,
                       "[Gateway][Session] HeaderSV service is unavailable on {}",
                       upstream_.endpoint());
            break;
        default:
            logger.log(Logger::Level::WARN,
                       "[Gateway][Session] {} initial tip not sent ({}): {}",
                       id_, to_string(result.status), result.detail);
            break;
        }

        initialPushPending_ = false;
        if (!writeInProgress_)
            do_write_next();
    }

    void NotificationSession::do_read()
    {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(&NotificationSession::on_read, shared_from_this()));
    }

    void NotificationSession::on_read(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (ec)
        {
            if (ec == ws::error::closed)
            {
                logger.log(Logger::Level::INFO,
                           "[Gateway][Session] {} closed by client", id_);
            }
            else if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::ERROR,
                           "[Gateway][Session] {} connection closed with exception: {}",
                           id_, ec.message());
            }

            teardown(ec == ws::error::closed ? "peer closed" : "read error");
            return;
        }

        metrics_.client_messages_in_total.fetch_add(1, std::memory_order_relaxed);

        // One-way channel: whatever the client sends is logged and dropped.
        if (ws_.got_text())
        {
            logger.log(Logger::Level::DEBUG,
                       "[Gateway][Session] {} client sent: {}",
                       id_, beast::buffers_to_string(buffer_.data()));
        }
        else
        {
            logger.log(Logger::Level::DEBUG,
                       "[Gateway][Session] {} client sent {} binary bytes (ignored)",
                       id_, bytes);
        }
        buffer_.consume(buffer_.size());

        if (state_ == State::active || (state_ == State::closing && closeRequested_))
            do_read();
    }

    void NotificationSession::send_binary(std::string payload)
    {
        const auto st = state_.load();
        if (st == State::closing || st == State::closed)
            return;

        auto self = shared_from_this();
        net::post(
            ws_.get_executor(),
            [self, payload = std::move(payload)]() mutable
            {
                self->do_enqueue(std::move(payload));
            });
    }

    void NotificationSession::do_enqueue(std::string payload)
    {
        if (state_ != State::active || closeRequested_)
            return;

        writeQueue_.push_back(std::move(payload));

        if (!writeInProgress_ && !initialPushPending_)
            do_write_next();
    }

    void NotificationSession::do_write_next()
    {
        if (state_ != State::active)
        {
            writeQueue_.clear();
            writeInProgress_ = false;
            return;
        }

        if (writeQueue_.empty())
        {
            writeInProgress_ = false;
            if (closeRequested_)
                do_close();
            return;
        }

        writeInProgress_ = true;

        // The frame stays at the front of the queue until the write completes.
        ws_.async_write(
            net::buffer(writeQueue_.front()),
            beast::bind_front_handler(&NotificationSession::on_write_complete, shared_from_this()));
    }

    void NotificationSession::on_write_complete(const boost::system::error_code &ec,
                                                std::size_t bytes)
    {
        writeInProgress_ = false;

        if (ec)
        {
            if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[Gateway][Session] {} write error: {}", id_, ec.message());
            }
            metrics_.errors_total.fetch_add(1, std::memory_order_relaxed);
            teardown("write failed");
            return;
        }

        if (!writeQueue_.empty())
            writeQueue_.pop_front();

        metrics_.tip_frames_out_total.fetch_add(1, std::memory_order_relaxed);
        logger.log(Logger::Level::DEBUG,
                   "[Gateway][Session] {} sent {} bytes", id_, bytes);

        do_write_next();
    }

    void NotificationSession::close()
    {
        auto self = shared_from_this();
        net::post(
            ws_.get_executor(),
            [self]()
            {
                if (self->closeRequested_)
                    return;

                self->closeRequested_ = true;

                // While connecting, on_accept picks the request up.
                if (self->state_ != State::active)
                    return;

                if (self->initialPushPending_)
                {
                    self->writeQueue_.clear();
                    self->do_close();
                }
                else if (!self->writeInProgress_)
                {
                    self->do_close();
                }
            });
    }

    void NotificationSession::do_close()
    {
        if (state_ != State::active)
            return;

        state_ = State::closing;

        auto self = shared_from_this();
        ws_.async_close(
            ws::close_code::normal,
            [self](const boost::system::error_code &ec)
            {
                if (ec && ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::WARN,
                               "[Gateway][Session] {} close error: {}", self->id_, ec.message());
                }
                self->teardown("closed by server");
            });
    }

    void NotificationSession::teardown(const char *reason)
    {
        if (state_ == State::closed)
            return;

        state_ = State::closing;

        auto &socket = beast::get_lowest_layer(ws_).socket();
        if (socket.is_open())
        {
            boost::system::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
            if (ec)
            {
                logger.log(Logger::Level::WARN,
                           "[Gateway][Session] {} socket close error: {}", id_, ec.message());
            }
        }

        if (registration_.active())
        {
            registration_.reset();
            metrics_.connections_active.fetch_sub(1, std::memory_order_relaxed);
        }

        writeQueue_.clear();
        state_ = State::closed;

        logger.log(Logger::Level::DEBUG,
                   "[Gateway][Session] {} removed ({})", id_, reason);
    }

} // namespace headerpush::gateway
