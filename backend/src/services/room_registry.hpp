#pragma once

#include <string>
#include <memory>
#include <unordered_map>
#include <mutex>
#include <vector>
#include <array>
#include <functional>

#include "../models/room.hpp"
#include "../protocol/message_types.hpp"

namespace netplay {

/**
 * @brief In-memory map of live rooms keyed by session id.
 *
 * The map is split into shards by session id hash, each with its own mutex,
 * so traffic on one room never waits on a lock held for an unrelated room.
 * Lock order is shard, then room.
 */
class RoomRegistry {
public:
    using RoomPtr = std::shared_ptr<Room>;

    RoomRegistry() = default;

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    /**
     * @brief Insert a room under sessionId.
     * @return false if a room with that id already exists (nothing is overwritten)
     */
    bool create(const std::string& sessionId, RoomPtr room) {
        auto& shard = shardFor(sessionId);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.rooms.emplace(sessionId, std::move(room)).second;
    }

    /**
     * @brief Get a room by session id.
     * @return Pointer to room, or nullptr if not found
     */
    RoomPtr get(const std::string& sessionId) const {
        const auto& shard = shardFor(sessionId);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.rooms.find(sessionId);
        return (it != shard.rooms.end()) ? it->second : nullptr;
    }

    bool exists(const std::string& sessionId) const {
        return get(sessionId) != nullptr;
    }

    /**
     * @brief Remove a room. Removing an absent id is a no-op.
     */
    void remove(const std::string& sessionId) {
        auto& shard = shardFor(sessionId);
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.rooms.erase(sessionId);
    }

    /**
     * @brief Remove sessionId only if it still maps to this exact room.
     *
     * A room emptied by its last player may already have been swept and its
     * id reused by a new room; that successor must survive.
     */
    void remove(const std::string& sessionId, const RoomPtr& room) {
        auto& shard = shardFor(sessionId);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.rooms.find(sessionId);
        if (it != shard.rooms.end() && it->second == room) {
            shard.rooms.erase(it);
        }
    }

    /**
     * @brief Rooms for gameId that still have a free slot.
     */
    std::vector<RoomSummary> listOpen(const std::string& gameId) const {
        std::vector<RoomSummary> open;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const auto& [_, room] : shard.rooms) {
                if (room->getGameId() != gameId) continue;
                RoomSummary summary = room->getSummary();
                if (summary.currentCount >= summary.maxPlayers) continue;
                open.push_back(std::move(summary));
            }
        }
        return open;
    }

    /**
     * @brief Delete every room that currently has no players.
     *
     * Each room is checked and closed under its own lock while the shard lock
     * is held, so a concurrent join either lands before the check (room kept)
     * or finds the room closed.
     *
     * @return Number of rooms removed
     */
    size_t sweepEmpty() {
        size_t removed = 0;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.rooms.begin(); it != shard.rooms.end(); ) {
                if (it->second->closeIfEmpty()) {
                    it = shard.rooms.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            total += shard.rooms.size();
        }
        return total;
    }

private:
    struct Shard {
        std::unordered_map<std::string, RoomPtr> rooms;
        mutable std::mutex mutex;
    };

    Shard& shardFor(const std::string& sessionId) {
        return shards_[std::hash<std::string>{}(sessionId) % shards_.size()];
    }

    const Shard& shardFor(const std::string& sessionId) const {
        return shards_[std::hash<std::string>{}(sessionId) % shards_.size()];
    }

    std::array<Shard, ProtocolConstants::RegistryShardCount> shards_;
};

} // namespace netplay
