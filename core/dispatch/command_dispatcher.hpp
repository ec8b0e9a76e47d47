#ifndef RELAY_DISPATCH_COMMAND_DISPATCHER_HPP
#define RELAY_DISPATCH_COMMAND_DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "connection/i_connection.hpp"
#include "pending_reply.hpp"
#include "registry/connection_registry.hpp"

namespace relay {
namespace dispatch {

enum class DispatchStatus {
    OK,
    DEVICE_OFFLINE,      // No registered connection (also used after a failed send)
    DEVICE_BUSY,         // A command is already outstanding for this device
    TIMEOUT,             // No reply before the deadline
    DEVICE_DISCONNECTED  // Connection closed or replaced while waiting
};

const char *dispatch_status_to_string(DispatchStatus status);

// Dispatch result - Status and the device reply on success
struct DispatchResult {
    bool success = false;
    DispatchStatus status = DispatchStatus::DEVICE_OFFLINE;
    std::string device_id;
    std::string payload;  // Device reply frame (success only)
    std::string error_message;
};

struct DispatchStats {
    uint64_t dispatched = 0;
    uint64_t replied = 0;
    uint64_t timed_out = 0;
    uint64_t disconnected = 0;
    uint64_t rejected_busy = 0;
    uint64_t offline = 0;
    uint64_t unsolicited = 0;
};

/**
 * @brief Routes commands to device connections and correlates replies
 *
 * One command may be outstanding per device. A second dispatch to a device
 * that is still waiting on a reply is rejected with DEVICE_BUSY rather than
 * queued. The next inbound frame from the device resolves the outstanding
 * command; frames with no outstanding command are dropped and logged.
 *
 * Thread model:
 * - dispatch() runs on HTTP worker threads and blocks only the caller
 * - deliver_frame() runs on channel I/O threads and never blocks on a caller
 * - Registry removals (close/replace) arrive through a removal listener
 *
 * The registry must outlive the dispatcher.
 */
class CommandDispatcher {
public:
    using ConnectionPtr = std::shared_ptr<connection::IConnection>;

    explicit CommandDispatcher(registry::ConnectionRegistry &registry,
                               std::chrono::milliseconds default_timeout = std::chrono::milliseconds(5000));
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher &) = delete;
    CommandDispatcher &operator=(const CommandDispatcher &) = delete;

    // Send command to device and wait for its reply.
    // The timeout runs from entry, so time spent in send_text counts against it.
    // A non-positive timeout uses the default timeout.
    DispatchResult dispatch(const std::string &device_id, const std::string &command,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Inbound frame from a device. Returns true if it resolved an outstanding command.
    bool deliver_frame(const std::string &device_id, const std::string &payload);

    // Same as above, but only resolves a command that was sent on `source`
    bool deliver_frame(const std::string &device_id, const ConnectionPtr &source, const std::string &payload);

    size_t pending_count() const;
    bool has_pending(const std::string &device_id) const;
    DispatchStats stats() const;
    std::chrono::milliseconds default_timeout() const { return default_timeout_; }

private:
    void on_connection_removed(const std::string &device_id, const ConnectionPtr &connection,
                               registry::RemovalReason reason);

    // Erase the slot for device_id if it is still `slot`
    void release_slot(const std::string &device_id, const std::shared_ptr<PendingReply> &slot);

    DispatchResult fail(DispatchResult result, DispatchStatus status, const std::string &message);

    registry::ConnectionRegistry &registry_;
    const std::chrono::milliseconds default_timeout_;
    registry::ConnectionRegistry::ListenerId listener_id_ = 0;

    mutable std::mutex mutex_;  // Protects pending_
    std::unordered_map<std::string, std::shared_ptr<PendingReply>> pending_;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> replied_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> disconnected_{0};
    std::atomic<uint64_t> rejected_busy_{0};
    std::atomic<uint64_t> offline_{0};
    std::atomic<uint64_t> unsolicited_{0};
};

}  // namespace dispatch
}  // namespace relay

#endif  // RELAY_DISPATCH_COMMAND_DISPATCHER_HPP
