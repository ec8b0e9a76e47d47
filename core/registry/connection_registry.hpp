#ifndef RELAY_REGISTRY_CONNECTION_REGISTRY_HPP
#define RELAY_REGISTRY_CONNECTION_REGISTRY_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "connection/i_connection.hpp"

namespace relay {
namespace registry {

// Why a connection left the registry
enum class RemovalReason {
    REPLACED,  // Same device id registered again (last writer wins)
    CLOSED,    // Channel closed, or send failure cleanup
    SHUTDOWN   // Registry cleared during shutdown
};

const char *removal_reason_to_string(RemovalReason reason);

/**
 * @brief Thread-safe map of device id -> live connection
 *
 * At most one connection is registered per device id. Registering a new
 * connection under an existing id removes the old one and closes it exactly
 * once. Unregister is identity-checked so a disconnect handler running late
 * for a superseded connection never erases the newer registration.
 *
 * Thread Safety:
 * - lookup(), snapshot(), connection_count() take a shared lock
 * - register/unregister/clear take an exclusive lock
 * - Removal listeners and close() run after the lock is released
 *
 * Usage Pattern:
 * ```cpp
 * // Channel handler
 * registry.register_connection(id, session);
 * ...
 * registry.unregister_connection(id, session);  // no-op if already replaced
 *
 * // Dispatch path
 * auto conn = registry.lookup(id);
 * if (conn) { conn->send_text(...); }
 * ```
 */
class ConnectionRegistry {
public:
    using ConnectionPtr = std::shared_ptr<connection::IConnection>;
    using RemovalListener =
        std::function<void(const std::string &device_id, const ConnectionPtr &connection, RemovalReason reason)>;
    using ListenerId = uint64_t;

    ConnectionRegistry() = default;
    ~ConnectionRegistry() = default;

    // Non-copyable, non-movable (manages mutex)
    ConnectionRegistry(const ConnectionRegistry &) = delete;
    ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;
    ConnectionRegistry(ConnectionRegistry &&) = delete;
    ConnectionRegistry &operator=(ConnectionRegistry &&) = delete;

    /**
     * @brief Install a connection as the active channel for a device
     *
     * Any previously registered connection for the id is removed, reported
     * to removal listeners as REPLACED, then closed. Empty ids and null
     * connections are ignored.
     */
    void register_connection(const std::string &device_id, ConnectionPtr connection);

    /**
     * @brief Remove a device mapping if it still points at this connection
     *
     * @return true if the mapping was removed, false if the id is unknown or
     *         a different connection is registered under it
     */
    bool unregister_connection(const std::string &device_id, const ConnectionPtr &connection);

    /**
     * @brief Current connection for a device (nullptr if not registered)
     *
     * The returned shared_ptr keeps the connection object alive even if it
     * is removed afterwards; sends on it then fail cleanly.
     */
    ConnectionPtr lookup(const std::string &device_id) const;

    // Registered device ids, sorted
    std::vector<std::string> snapshot() const;

    bool is_registered(const std::string &device_id) const;
    size_t connection_count() const;

    // Remove and close every connection (reason SHUTDOWN)
    void clear();

    // Listeners are called from whichever thread performed the removal
    ListenerId add_removal_listener(RemovalListener listener);
    void remove_removal_listener(ListenerId id);

private:
    void notify_removed(const std::string &device_id, const ConnectionPtr &connection, RemovalReason reason);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ConnectionPtr> connections_;

    std::mutex listeners_mutex_;
    std::vector<std::pair<ListenerId, RemovalListener>> listeners_;
    ListenerId next_listener_id_ = 1;
};

}  // namespace registry
}  // namespace relay

#endif  // RELAY_REGISTRY_CONNECTION_REGISTRY_HPP
