#pragma once

/**
 * @file pending_reply.hpp
 * @brief Single-use reply slot for one in-flight device command
 *
 * A slot is created by CommandDispatcher when a command is sent and is
 * resolved exactly once, by whichever comes first:
 * - fulfill(): the device's next inbound frame
 * - discard(): the connection closed or was replaced
 * - wait_until(): the caller's deadline passed
 *
 * Resolution happens under the slot mutex, so a frame that arrives after the
 * deadline sees an already-resolved slot and is rejected (fulfill() returns
 * false) instead of being handed to a caller that has already returned.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "connection/i_connection.hpp"

namespace relay {
namespace dispatch {

enum class ReplyKind {
    REPLY,        // Device answered
    TIMEOUT,      // Deadline passed first
    DISCONNECTED  // Connection closed or replaced first
};

struct ReplyOutcome {
    ReplyKind kind = ReplyKind::TIMEOUT;
    std::string payload;  // Device frame (REPLY only)
    std::string reason;   // Why the slot was discarded (DISCONNECTED only)
};

class PendingReply {
public:
    PendingReply(std::string device_id, std::shared_ptr<connection::IConnection> connection)
        : device_id_(std::move(device_id)), connection_(std::move(connection)) {}

    // Non-copyable (owns a condition variable)
    PendingReply(const PendingReply &) = delete;
    PendingReply &operator=(const PendingReply &) = delete;

    /**
     * @brief Hand the device's reply to the waiting caller
     *
     * Never blocks beyond the slot mutex.
     *
     * @return true if this call resolved the slot, false if it was already resolved
     */
    bool fulfill(std::string payload) {
        ReplyOutcome outcome;
        outcome.kind = ReplyKind::REPLY;
        outcome.payload = std::move(payload);
        return resolve(std::move(outcome));
    }

    /**
     * @brief Resolve as DISCONNECTED (connection went away before a reply)
     */
    bool discard(const std::string &reason) {
        ReplyOutcome outcome;
        outcome.kind = ReplyKind::DISCONNECTED;
        outcome.reason = reason;
        return resolve(std::move(outcome));
    }

    /**
     * @brief Block until resolved or until the deadline passes
     *
     * If the deadline passes first the slot resolves itself as TIMEOUT, so
     * the returned outcome is final either way. A deadline already in the
     * past still returns a reply that arrived before the call.
     */
    ReplyOutcome wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return resolved_; });

        if (!resolved_) {
            resolved_ = true;
            outcome_.kind = ReplyKind::TIMEOUT;
        }
        return outcome_;
    }

    ReplyOutcome wait_for(std::chrono::milliseconds timeout) {
        return wait_until(std::chrono::steady_clock::now() + timeout);
    }

    bool is_resolved() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return resolved_;
    }

    const std::string &device_id() const { return device_id_; }
    const std::shared_ptr<connection::IConnection> &connection() const { return connection_; }

private:
    bool resolve(ReplyOutcome outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (resolved_) {
                return false;
            }
            outcome_ = std::move(outcome);
            resolved_ = true;
        }
        cv_.notify_all();
        return true;
    }

    const std::string device_id_;
    const std::shared_ptr<connection::IConnection> connection_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ReplyOutcome outcome_;
    bool resolved_ = false;
};

}  // namespace dispatch
}  // namespace relay
