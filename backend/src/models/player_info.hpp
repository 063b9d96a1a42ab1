#pragma once

#include <string>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace netplay {

/**
 * @brief A player's binding to a connection within a room.
 */
struct PlayerInfo {
    std::string playerId;        // Caller-supplied identifier (map key)
    std::string connectionId;    // Connection currently bound to this player
    std::string displayName;     // extra.player_name, may be empty
    nlohmann::json metadata;     // Caller's "extra" object, passed through untouched
    uint64_t joinOrder;          // Monotonic per room, used for owner hand-over

    PlayerInfo()
        : metadata(nlohmann::json::object())
        , joinOrder(0)
    {}

    PlayerInfo(const std::string& pid, const std::string& connId, const nlohmann::json& extra)
        : playerId(pid)
        , connectionId(connId)
        , metadata(extra.is_object() ? extra : nlohmann::json::object())
        , joinOrder(0)
    {
        auto it = metadata.find("player_name");
        if (it != metadata.end() && it->is_string()) {
            displayName = it->get<std::string>();
        }
    }

    /**
     * @brief Wire form sent in users-updated: the metadata plus the bound socketId.
     */
    nlohmann::json toJson() const {
        nlohmann::json j = metadata;
        j["socketId"] = connectionId;
        return j;
    }
};

/**
 * @brief A live signaling pair, pruned when either side leaves.
 */
struct PeerLink {
    std::string sourceConnectionId;
    std::string targetConnectionId;

    bool involves(const std::string& connectionId) const {
        return sourceConnectionId == connectionId || targetConnectionId == connectionId;
    }

    bool operator==(const PeerLink& other) const {
        return sourceConnectionId == other.sourceConnectionId &&
               targetConnectionId == other.targetConnectionId;
    }
};

} // namespace netplay
