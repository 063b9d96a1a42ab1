#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace netplay {

/**
 * @brief Live connections by connection id, for point-to-point delivery.
 *
 * Holds weak references only; a session that has gone away is skipped.
 * Session must provide a non-blocking send(const std::string&).
 */
template <typename Session>
class ConnectionDirectory {
public:
    void add(const std::string& connectionId, const std::shared_ptr<Session>& session) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        sessions_[connectionId] = session;
    }

    void remove(const std::string& connectionId) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        sessions_.erase(connectionId);
    }

    std::shared_ptr<Session> find(const std::string& connectionId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(connectionId);
        return (it != sessions_.end()) ? it->second.lock() : nullptr;
    }

    /**
     * @brief Queue a message for a connection. Unknown or closed connections are ignored.
     * @return true if the message was handed to a live session
     */
    bool send(const std::string& connectionId, const std::string& message) const {
        auto session = find(connectionId);
        if (!session) {
            return false;
        }
        session->send(message);
        return true;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return sessions_.size();
    }

private:
    std::unordered_map<std::string, std::weak_ptr<Session>> sessions_;
    mutable std::shared_mutex mutex_;
};

} // namespace netplay
