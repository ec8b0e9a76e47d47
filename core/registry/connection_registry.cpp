#include "connection_registry.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace relay {
namespace registry {

const char *removal_reason_to_string(RemovalReason reason) {
    switch (reason) {
        case RemovalReason::REPLACED:
            return "replaced";
        case RemovalReason::CLOSED:
            return "closed";
        case RemovalReason::SHUTDOWN:
            return "shutdown";
        default:
            return "unknown";
    }
}

void ConnectionRegistry::register_connection(const std::string &device_id, ConnectionPtr connection) {
    if (device_id.empty() || !connection) {
        LOG_WARN("[Registry] Ignoring registration with empty device id or null connection");
        return;
    }

    ConnectionPtr previous;
    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = connections_.find(device_id);
        if (it != connections_.end()) {
            if (it->second == connection) {
                return;  // Already the active connection
            }
            previous = std::move(it->second);
            it->second = std::move(connection);
        } else {
            connections_.emplace(device_id, std::move(connection));
        }
        count = connections_.size();
    }

    if (previous) {
        LOG_WARN("[Registry] Device " << device_id << " reconnected, replacing session " << previous->session_id());
        notify_removed(device_id, previous, RemovalReason::REPLACED);
        previous->close("connection replaced");
    }

    LOG_INFO("[Registry] Registered: " << device_id << " (" << count << " connected)");
}

bool ConnectionRegistry::unregister_connection(const std::string &device_id, const ConnectionPtr &connection) {
    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = connections_.find(device_id);
        if (it == connections_.end() || it->second != connection) {
            LOG_DEBUG("[Registry] Stale unregister ignored for " << device_id);
            return false;
        }
        connections_.erase(it);
        count = connections_.size();
    }

    notify_removed(device_id, connection, RemovalReason::CLOSED);
    LOG_INFO("[Registry] Unregistered: " << device_id << " (" << count << " connected)");
    return true;
}

ConnectionRegistry::ConnectionPtr ConnectionRegistry::lookup(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = connections_.find(device_id);
    if (it != connections_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> ConnectionRegistry::snapshot() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        ids.reserve(connections_.size());
        for (const auto &[id, connection] : connections_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool ConnectionRegistry::is_registered(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.find(device_id) != connections_.end();
}

size_t ConnectionRegistry::connection_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::clear() {
    std::unordered_map<std::string, ConnectionPtr> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        removed.swap(connections_);
    }

    if (removed.empty()) {
        return;
    }

    LOG_INFO("[Registry] Closing " << removed.size() << " connections");
    for (const auto &[id, connection] : removed) {
        notify_removed(id, connection, RemovalReason::SHUTDOWN);
        connection->close("server shutting down");
    }
}

ConnectionRegistry::ListenerId ConnectionRegistry::add_removal_listener(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void ConnectionRegistry::remove_removal_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto &entry) { return entry.first == id; }),
                     listeners_.end());
}

void ConnectionRegistry::notify_removed(const std::string &device_id, const ConnectionPtr &connection,
                                        RemovalReason reason) {
    std::vector<std::pair<ListenerId, RemovalListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto &entry : listeners) {
        entry.second(device_id, connection, reason);
    }
}

}  // namespace registry
}  // namespace relay
