#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include <algorithm>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "player_info.hpp"
#include "../protocol/message_types.hpp"

namespace netplay {

/**
 * @brief Creator-supplied room attributes. Immutable once the room exists.
 */
struct RoomSettings {
    std::string roomName;
    std::string gameId = std::string(ProtocolConstants::DefaultGameId);
    std::string domain = std::string(ProtocolConstants::DefaultDomain);
    std::optional<std::string> password;
    size_t maxPlayers = ProtocolConstants::DefaultMaxPlayers;
};

/**
 * @brief Public view of a room for discovery. Never carries the password.
 */
struct RoomSummary {
    std::string sessionId;
    std::string roomName;
    size_t currentCount = 0;
    size_t maxPlayers = 0;
    std::string ownerDisplayName;
    bool hasPassword = false;
};

/**
 * @brief Outcome of a player leaving a room.
 */
struct DepartureResult {
    bool roomFound = false;    // false if the room was already closed
    bool roomEmpty = false;    // true if this departure closed the room
    bool ownerChanged = false;
};

/**
 * @brief An ephemeral multiplayer session: players, owner, broadcast group and signaling pairs.
 *
 * Every mutation happens under the room's own mutex, so rooms never contend
 * with each other. Once closed (emptied and dropped from the registry) a room
 * refuses further admissions.
 */
class Room {
public:
    using DeliverFunc = std::function<void(const std::string& connectionId)>;
    using MessageBuilder = std::function<std::string(const nlohmann::json& players)>;

    Room(const std::string& sessionId, RoomSettings settings)
        : sessionId_(sessionId)
        , settings_(std::move(settings))
        , nextJoinOrder_(1)
        , closed_(false)
    {
        if (settings_.roomName.empty()) {
            settings_.roomName = "Room " + sessionId_;
        }
        if (settings_.password && settings_.password->empty()) {
            settings_.password.reset();
        }
        if (settings_.maxPlayers == 0) {
            settings_.maxPlayers = ProtocolConstants::DefaultMaxPlayers;
        }
    }

    // Non-copyable
    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    // Not movable (contains mutex)
    Room(Room&&) = delete;
    Room& operator=(Room&&) = delete;

    // =========================================================================
    // Room Properties
    // =========================================================================

    const std::string& getId() const { return sessionId_; }
    const std::string& getRoomName() const { return settings_.roomName; }
    const std::string& getGameId() const { return settings_.gameId; }
    const std::string& getDomain() const { return settings_.domain; }
    size_t getMaxPlayers() const { return settings_.maxPlayers; }
    bool hasPassword() const { return settings_.password.has_value(); }

    bool validatePassword(const std::optional<std::string>& supplied) const {
        if (!settings_.password) return true;
        return supplied.has_value() && *supplied == *settings_.password;
    }

    bool isClosed() const {
        return closed_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Membership
    // =========================================================================

    /**
     * @brief Admit a player and subscribe its connection to the broadcast group.
     *
     * Re-admitting an existing playerId replaces the previous binding but
     * keeps its place in the join order. The first player admitted becomes
     * the owner.
     *
     * @return Error code if refused, nullopt if admitted
     */
    std::optional<ErrorCode> admit(PlayerInfo player, const std::optional<std::string>& password) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed)) {
            return ErrorCode::RoomNotFound;
        }
        if (!validatePassword(password)) {
            return ErrorCode::IncorrectPassword;
        }
        if (players_.size() >= settings_.maxPlayers) {
            return ErrorCode::RoomFull;
        }

        const std::string connectionId = player.connectionId;

        auto existing = players_.find(player.playerId);
        if (existing != players_.end()) {
            player.joinOrder = existing->second.joinOrder;
            if (existing->second.connectionId == ownerConnectionId_) {
                ownerConnectionId_ = connectionId;
            }
        } else {
            player.joinOrder = nextJoinOrder_++;
        }
        if (players_.empty()) {
            ownerConnectionId_ = connectionId;
        }
        players_[player.playerId] = std::move(player);
        subscribeLocked(connectionId);
        return std::nullopt;
    }

    /**
     * @brief Remove a connection's player binding, its signaling pairs and its subscription.
     *
     * The player entry is only removed if it is still bound to connectionId;
     * a re-join from another connection keeps its entry.
     */
    DepartureResult depart(const std::string& playerId, const std::string& connectionId) {
        std::lock_guard<std::mutex> lock(mutex_);
        DepartureResult result;
        if (closed_.load(std::memory_order_relaxed)) {
            return result;
        }
        result.roomFound = true;

        auto it = players_.find(playerId);
        if (it != players_.end() && it->second.connectionId == connectionId) {
            players_.erase(it);
        }

        peers_.erase(
            std::remove_if(peers_.begin(), peers_.end(),
                           [&connectionId](const PeerLink& link) { return link.involves(connectionId); }),
            peers_.end());

        subscribers_.erase(
            std::remove(subscribers_.begin(), subscribers_.end(), connectionId),
            subscribers_.end());

        if (players_.empty()) {
            closed_.store(true, std::memory_order_release);
            result.roomEmpty = true;
            return result;
        }

        if (!isBoundLocked(ownerConnectionId_)) {
            ownerConnectionId_ = earliestPlayerLocked().connectionId;
            result.ownerChanged = true;
        }
        return result;
    }

    /**
     * @brief Close the room if it has no players. Used by the reaper.
     * @return true if the room is (now) closed because it is empty
     */
    bool closeIfEmpty() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!players_.empty()) {
            return false;
        }
        closed_.store(true, std::memory_order_release);
        return true;
    }

    size_t getPlayerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return players_.size();
    }

    bool isEmpty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return players_.empty();
    }

    std::optional<PlayerInfo> getPlayer(const std::string& playerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = players_.find(playerId);
        if (it == players_.end()) return std::nullopt;
        return it->second;
    }

    std::string getOwnerConnectionId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ownerConnectionId_;
    }

    /**
     * @brief Full players mapping in wire form (playerId -> record).
     */
    nlohmann::json getPlayersJson() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return playersJsonLocked();
    }

    std::vector<std::string> getSubscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_;
    }

    bool isSubscribed(const std::string& connectionId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(subscribers_.begin(), subscribers_.end(), connectionId) != subscribers_.end();
    }

    RoomSummary getSummary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        RoomSummary summary;
        summary.sessionId = sessionId_;
        summary.roomName = settings_.roomName;
        summary.currentCount = players_.size();
        summary.maxPlayers = settings_.maxPlayers;
        summary.hasPassword = settings_.password.has_value();
        summary.ownerDisplayName = std::string(ProtocolConstants::UnknownOwnerName);
        for (const auto& [_, info] : players_) {
            if (info.connectionId == ownerConnectionId_) {
                if (!info.displayName.empty()) {
                    summary.ownerDisplayName = info.displayName;
                }
                break;
            }
        }
        return summary;
    }

    // =========================================================================
    // Signaling Pairs
    // =========================================================================

    /**
     * @brief Record a signaling pair if it is not already known.
     */
    void addPeer(const PeerLink& link) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed)) return;
        if (std::find(peers_.begin(), peers_.end(), link) == peers_.end()) {
            peers_.push_back(link);
        }
    }

    std::vector<PeerLink> getPeers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_;
    }

    // =========================================================================
    // Broadcasting
    // =========================================================================

    /**
     * @brief Deliver a message to every subscriber except one.
     * @param excludeConnectionId Connection to skip (empty = send to all)
     */
    void broadcast(const std::string& excludeConnectionId, const DeliverFunc& deliver) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& connectionId : subscribers_) {
            if (connectionId == excludeConnectionId) continue;
            deliver(connectionId);
        }
    }

    /**
     * @brief Build a message from the current players mapping and deliver it to all subscribers.
     *
     * Snapshot and delivery happen under the same lock, so subscribers see
     * membership snapshots in the order the changes were applied.
     *
     * @return The players mapping that was sent
     */
    nlohmann::json broadcastPlayers(const MessageBuilder& buildMessage,
                                    const std::function<void(const std::string&, const std::string&)>& send) const {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json players = playersJsonLocked();
        const std::string message = buildMessage(players);
        for (const auto& connectionId : subscribers_) {
            send(connectionId, message);
        }
        return players;
    }

private:
    void subscribeLocked(const std::string& connectionId) {
        if (std::find(subscribers_.begin(), subscribers_.end(), connectionId) == subscribers_.end()) {
            subscribers_.push_back(connectionId);
        }
    }

    bool isBoundLocked(const std::string& connectionId) const {
        for (const auto& [_, info] : players_) {
            if (info.connectionId == connectionId) return true;
        }
        return false;
    }

    /**
     * @brief Player with the lowest join order. Must be called with mutex held and players_ non-empty.
     */
    const PlayerInfo& earliestPlayerLocked() const {
        auto it = std::min_element(players_.begin(), players_.end(),
            [](const auto& a, const auto& b) { return a.second.joinOrder < b.second.joinOrder; });
        return it->second;
    }

    nlohmann::json playersJsonLocked() const {
        nlohmann::json players = nlohmann::json::object();
        for (const auto& [playerId, info] : players_) {
            players[playerId] = info.toJson();
        }
        return players;
    }

    std::string sessionId_;
    RoomSettings settings_;
    std::string ownerConnectionId_;
    std::unordered_map<std::string, PlayerInfo> players_;
    std::vector<PeerLink> peers_;
    std::vector<std::string> subscribers_;
    uint64_t nextJoinOrder_;
    std::atomic<bool> closed_;
    mutable std::mutex mutex_;
};

} // namespace netplay
