#include "command_dispatcher.hpp"

#include "logging/logger.hpp"

namespace relay {
namespace dispatch {

namespace {
constexpr size_t kMaxLoggedPayload = 200;

std::string preview(const std::string &payload) {
    if (payload.size() <= kMaxLoggedPayload) {
        return payload;
    }
    return payload.substr(0, kMaxLoggedPayload) + "... (" + std::to_string(payload.size()) + " bytes)";
}
}  // namespace

const char *dispatch_status_to_string(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::OK:
            return "OK";
        case DispatchStatus::DEVICE_OFFLINE:
            return "DEVICE_OFFLINE";
        case DispatchStatus::DEVICE_BUSY:
            return "DEVICE_BUSY";
        case DispatchStatus::TIMEOUT:
            return "TIMEOUT";
        case DispatchStatus::DEVICE_DISCONNECTED:
            return "DEVICE_DISCONNECTED";
        default:
            return "UNKNOWN";
    }
}

CommandDispatcher::CommandDispatcher(registry::ConnectionRegistry &registry,
                                     std::chrono::milliseconds default_timeout)
    : registry_(registry), default_timeout_(default_timeout) {
    listener_id_ = registry_.add_removal_listener(
        [this](const std::string &device_id, const ConnectionPtr &connection, registry::RemovalReason reason) {
            on_connection_removed(device_id, connection, reason);
        });
}

CommandDispatcher::~CommandDispatcher() { registry_.remove_removal_listener(listener_id_); }

DispatchResult CommandDispatcher::dispatch(const std::string &device_id, const std::string &command,
                                           std::chrono::milliseconds timeout) {
    DispatchResult result;
    result.device_id = device_id;
    if (timeout.count() <= 0) {
        timeout = default_timeout_;
    }
    // A slow send eats into the reply window rather than extending it
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    dispatched_.fetch_add(1, std::memory_order_relaxed);

    auto connection = registry_.lookup(device_id);
    if (!connection) {
        offline_.fetch_add(1, std::memory_order_relaxed);
        return fail(std::move(result), DispatchStatus::DEVICE_OFFLINE, "Device " + device_id + " is not connected");
    }

    auto slot = std::make_shared<PendingReply>(device_id, connection);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.find(device_id) != pending_.end()) {
            rejected_busy_.fetch_add(1, std::memory_order_relaxed);
            return fail(std::move(result), DispatchStatus::DEVICE_BUSY,
                        "Device " + device_id + " is busy with another command");
        }
        pending_.emplace(device_id, slot);
    }

    // The removal listener only sees slots that already exist, so a close or
    // replace that landed between lookup() and the insert above is caught here.
    auto current = registry_.lookup(device_id);
    if (current != connection) {
        release_slot(device_id, slot);
        if (!current) {
            offline_.fetch_add(1, std::memory_order_relaxed);
            return fail(std::move(result), DispatchStatus::DEVICE_OFFLINE, "Device " + device_id + " disconnected");
        }
        disconnected_.fetch_add(1, std::memory_order_relaxed);
        return fail(std::move(result), DispatchStatus::DEVICE_DISCONNECTED,
                    "Device " + device_id + " connection replaced before send");
    }

    std::string send_error;
    if (!connection->send_text(command, send_error)) {
        release_slot(device_id, slot);
        if (!slot->discard("send failed")) {
            // Already resolved, so this returns at once
            ReplyOutcome earlier = slot->wait_until(deadline);
            if (earlier.kind == ReplyKind::REPLY) {
                unsolicited_.fetch_add(1, std::memory_order_relaxed);
                LOG_INFO("[Dispatcher] Reply from " << device_id
                                                    << " dropped after failed send: " << preview(earlier.payload));
            }
        }
        LOG_ERROR("[Dispatcher] Send to " << device_id << " failed: " << send_error);

        if (registry_.unregister_connection(device_id, connection)) {
            connection->close("send failed");
        }
        offline_.fetch_add(1, std::memory_order_relaxed);
        return fail(std::move(result), DispatchStatus::DEVICE_OFFLINE, "Send failed: " + send_error);
    }

    LOG_INFO("[Dispatcher] Command sent to " << device_id << ": " << preview(command));

    ReplyOutcome outcome = slot->wait_until(deadline);
    release_slot(device_id, slot);

    switch (outcome.kind) {
        case ReplyKind::REPLY:
            replied_.fetch_add(1, std::memory_order_relaxed);
            result.success = true;
            result.status = DispatchStatus::OK;
            result.payload = std::move(outcome.payload);
            LOG_INFO("[Dispatcher] Reply from " << device_id << ": " << preview(result.payload));
            return result;
        case ReplyKind::TIMEOUT:
            timed_out_.fetch_add(1, std::memory_order_relaxed);
            return fail(std::move(result), DispatchStatus::TIMEOUT,
                        "No reply from device " + device_id + " within " + std::to_string(timeout.count()) + "ms");
        case ReplyKind::DISCONNECTED:
        default:
            disconnected_.fetch_add(1, std::memory_order_relaxed);
            return fail(std::move(result), DispatchStatus::DEVICE_DISCONNECTED,
                        "Device " + device_id + " " + outcome.reason + " before reply");
    }
}

bool CommandDispatcher::deliver_frame(const std::string &device_id, const std::string &payload) {
    return deliver_frame(device_id, nullptr, payload);
}

bool CommandDispatcher::deliver_frame(const std::string &device_id, const ConnectionPtr &source,
                                      const std::string &payload) {
    std::shared_ptr<PendingReply> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(device_id);
        if (it != pending_.end() && (!source || it->second->connection() == source)) {
            slot = it->second;
            pending_.erase(it);
        }
    }

    if (slot && slot->fulfill(payload)) {
        return true;
    }

    unsolicited_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("[Dispatcher] Unsolicited frame from " << device_id << " dropped: " << preview(payload));
    return false;
}

size_t CommandDispatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CommandDispatcher::has_pending(const std::string &device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.find(device_id) != pending_.end();
}

DispatchStats CommandDispatcher::stats() const {
    DispatchStats stats;
    stats.dispatched = dispatched_.load(std::memory_order_relaxed);
    stats.replied = replied_.load(std::memory_order_relaxed);
    stats.timed_out = timed_out_.load(std::memory_order_relaxed);
    stats.disconnected = disconnected_.load(std::memory_order_relaxed);
    stats.rejected_busy = rejected_busy_.load(std::memory_order_relaxed);
    stats.offline = offline_.load(std::memory_order_relaxed);
    stats.unsolicited = unsolicited_.load(std::memory_order_relaxed);
    return stats;
}

void CommandDispatcher::on_connection_removed(const std::string &device_id, const ConnectionPtr &connection,
                                              registry::RemovalReason reason) {
    std::shared_ptr<PendingReply> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(device_id);
        if (it != pending_.end() && it->second->connection() == connection) {
            slot = it->second;
            pending_.erase(it);
        }
    }

    if (!slot) {
        return;
    }

    std::string why = reason == registry::RemovalReason::REPLACED ? "connection replaced" : "connection closed";
    if (slot->discard(why)) {
        LOG_WARN("[Dispatcher] Outstanding command for " << device_id << " abandoned ("
                                                         << registry::removal_reason_to_string(reason) << ")");
    }
}

void CommandDispatcher::release_slot(const std::string &device_id, const std::shared_ptr<PendingReply> &slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(device_id);
    if (it != pending_.end() && it->second == slot) {
        pending_.erase(it);
    }
}

DispatchResult CommandDispatcher::fail(DispatchResult result, DispatchStatus status, const std::string &message) {
    result.success = false;
    result.status = status;
    result.error_message = message;
    LOG_WARN("[Dispatcher] " << dispatch_status_to_string(status) << ": " << message);
    return result;
}

}  // namespace dispatch
}  // namespace relay
