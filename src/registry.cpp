#include <headerpush/gateway/registry.hpp>

#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace headerpush::gateway
{
    ConnectionRegistry::Registration::Registration(ConnectionRegistry &registry,
                                                   std::string id) noexcept
        : registry_(&registry), id_(std::move(id))
    {
    }

    ConnectionRegistry::Registration::Registration(Registration &&other) noexcept
        : registry_(std::exchange(other.registry_, nullptr)), id_(std::move(other.id_))
    {
    }

    ConnectionRegistry::Registration &
    ConnectionRegistry::Registration::operator=(Registration &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            registry_ = std::exchange(other.registry_, nullptr);
            id_ = std::move(other.id_);
        }
        return *this;
    }

    void ConnectionRegistry::Registration::reset() noexcept
    {
        if (!registry_)
            return;

        auto *registry = std::exchange(registry_, nullptr);
        try
        {
            registry->remove(id_);
        }
        catch (const std::system_error &)
        {
            // mutex failure; nothing left to undo
        }
    }

    bool ConnectionRegistry::insert(const std::string &id, std::weak_ptr<Connection> connection)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.emplace(id, std::move(connection)).second;
    }

    void ConnectionRegistry::remove(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.erase(id);
    }

    ConnectionRegistry::Registration
    ConnectionRegistry::enroll(const std::shared_ptr<Connection> &connection)
    {
        if (!connection)
            throw std::invalid_argument("cannot register a null connection");

        const std::string &id = connection->id();
        if (!insert(id, connection))
            throw std::invalid_argument("connection id already registered: " + id);

        return Registration{*this, id};
    }

    std::size_t ConnectionRegistry::for_each(const Visitor &fn) const
    {
        std::vector<std::shared_ptr<Connection>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(connections_.size());
            for (const auto &entry : connections_)
            {
                if (auto c = entry.second.lock())
                    snapshot.push_back(std::move(c));
            }
        }

        for (const auto &c : snapshot)
            fn(*c);

        return snapshot.size();
    }

    bool ConnectionRegistry::contains(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.count(id) != 0;
    }

    std::size_t ConnectionRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

} // namespace headerpush::gateway
