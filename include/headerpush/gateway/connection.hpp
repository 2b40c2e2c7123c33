#ifndef HEADERPUSH_GATEWAY_CONNECTION_HPP
#define HEADERPUSH_GATEWAY_CONNECTION_HPP

#include <string>

namespace headerpush::gateway
{
    /**
     * @brief A registered push target.
     *
     * Implemented by NotificationSession. Both mutators may be called from any
     * thread; implementations hop onto their own executor.
     */
    class Connection
    {
    public:
        virtual ~Connection() = default;

        /// Opaque unique id, fixed for the lifetime of the connection.
        virtual const std::string &id() const noexcept = 0;

        /// Queue one binary message.
        virtual void send_binary(std::string payload) = 0;

        /// Request a normal close. Idempotent.
        virtual void close() = 0;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_CONNECTION_HPP
