#ifndef HEADERPUSH_GATEWAY_REGISTRY_HPP
#define HEADERPUSH_GATEWAY_REGISTRY_HPP

/**
 * @file registry.hpp
 * @brief Process-wide id -> connection map shared by all sessions.
 *
 * The registry holds weak references only: a session's lifetime is driven by
 * its pending I/O, never by being registered. Iteration works on a snapshot
 * taken under the lock so callbacks may remove (or insert) concurrently.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <headerpush/gateway/connection.hpp>

namespace headerpush::gateway
{
    class ConnectionRegistry
    {
    public:
        using Visitor = std::function<void(Connection &)>;

        /**
         * @brief Scoped registration. Removes its entry when reset or destroyed.
         */
        class Registration
        {
        public:
            Registration() = default;
            Registration(ConnectionRegistry &registry, std::string id) noexcept;
            ~Registration() { reset(); }

            Registration(Registration &&other) noexcept;
            Registration &operator=(Registration &&other) noexcept;
            Registration(const Registration &) = delete;
            Registration &operator=(const Registration &) = delete;

            void reset() noexcept;
            bool active() const noexcept { return registry_ != nullptr; }
            const std::string &id() const noexcept { return id_; }

        private:
            ConnectionRegistry *registry_ = nullptr;
            std::string id_;
        };

        ConnectionRegistry() = default;
        ConnectionRegistry(const ConnectionRegistry &) = delete;
        ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

        /// Returns false (and leaves the existing entry alone) if @p id is taken.
        bool insert(const std::string &id, std::weak_ptr<Connection> connection);

        /// No-op if @p id is not registered.
        void remove(const std::string &id);

        /**
         * @brief Insert @p connection under its own id and bind removal to the
         *        returned handle.
         * @throws std::invalid_argument if the id is already registered.
         */
        [[nodiscard]] Registration enroll(const std::shared_ptr<Connection> &connection);

        /// Calls @p fn for every live connection. Returns how many were visited.
        std::size_t for_each(const Visitor &fn) const;

        bool contains(const std::string &id) const;
        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::weak_ptr<Connection>> connections_;
    };

} // namespace headerpush::gateway

#endif // HEADERPUSH_GATEWAY_REGISTRY_HPP
