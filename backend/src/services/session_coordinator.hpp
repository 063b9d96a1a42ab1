#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

#include "room_registry.hpp"
#include "../models/room.hpp"
#include "../models/player_info.hpp"
#include "../protocol/message_codec.hpp"
#include "../protocol/message_types.hpp"

namespace netplay {

/**
 * @brief The room a connection is attached to.
 */
struct Attachment {
    std::string sessionId;
    std::string playerId;
    std::weak_ptr<Room> room;
};

/**
 * @brief Per-connection state, owned by the transport session.
 *
 * A connection's events are handled one at a time in arrival order, so the
 * context needs no locking of its own.
 */
struct ConnectionContext {
    std::string connectionId;
    std::optional<Attachment> attachment;

    explicit ConnectionContext(std::string id)
        : connectionId(std::move(id))
    {}

    bool isAttached() const { return attachment.has_value(); }
};

/**
 * @brief Result of a join room operation.
 */
struct JoinResult {
    bool success;
    ErrorCode errorCode;
    nlohmann::json players;

    static JoinResult Success(nlohmann::json currentPlayers) {
        return {true, ErrorCode::InternalError, std::move(currentPlayers)};
    }

    static JoinResult Failure(ErrorCode code) {
        return {false, code, nlohmann::json::object()};
    }
};

/**
 * @brief Turns connection events into room registry changes and relays.
 *
 * All outbound traffic goes through the injected SendFunc, which must not
 * block; delivery to a connection that is gone is dropped by the sender.
 */
class SessionCoordinator {
public:
    using SendFunc = std::function<void(const std::string& connectionId, const std::string& message)>;

    SessionCoordinator(RoomRegistry& registry, SendFunc sendFunc)
        : registry_(registry)
        , sendFunc_(std::move(sendFunc))
    {}

    // =========================================================================
    // Room Lifecycle
    // =========================================================================

    /**
     * @brief Create a room owned by this connection.
     *
     * If the connection is attached elsewhere it leaves that room once the
     * new room has been created.
     *
     * @return Error code if failed, nullopt if success
     */
    std::optional<ErrorCode> openRoom(ConnectionContext& conn, const RoomRequest& request) {
        if (request.sessionId.empty() || request.playerId.empty()) {
            return ErrorCode::InvalidRequest;
        }

        auto room = std::make_shared<Room>(request.sessionId, MessageCodec::toRoomSettings(request));
        auto admitError = room->admit(
            PlayerInfo(request.playerId, conn.connectionId, request.extra), request.password);
        if (admitError) {
            return admitError;
        }

        if (!registry_.create(request.sessionId, room)) {
            return ErrorCode::RoomAlreadyExists;
        }

        leaveRoom(conn);
        conn.attachment = Attachment{request.sessionId, request.playerId, room};
        broadcastPlayers(*room);
        return std::nullopt;
    }

    /**
     * @brief Join an existing room.
     *
     * A connection attached under a different (sessionId, playerId) leaves
     * first; re-joining with the same pair just refreshes the binding.
     */
    JoinResult joinRoom(ConnectionContext& conn, const RoomRequest& request) {
        if (request.sessionId.empty() || request.playerId.empty()) {
            return JoinResult::Failure(ErrorCode::InvalidRequest);
        }

        if (conn.attachment &&
            (conn.attachment->sessionId != request.sessionId ||
             conn.attachment->playerId != request.playerId)) {
            leaveRoom(conn);
        }

        auto room = registry_.get(request.sessionId);
        if (!room) {
            return JoinResult::Failure(ErrorCode::RoomNotFound);
        }

        auto admitError = room->admit(
            PlayerInfo(request.playerId, conn.connectionId, request.extra), request.password);
        if (admitError) {
            return JoinResult::Failure(*admitError);
        }

        conn.attachment = Attachment{request.sessionId, request.playerId, room};
        return JoinResult::Success(broadcastPlayers(*room));
    }

    /**
     * @brief Leave the attached room. Also the disconnect handler; safe to call repeatedly.
     */
    void leaveRoom(ConnectionContext& conn) {
        if (!conn.attachment) return;

        Attachment attachment = std::move(*conn.attachment);
        conn.attachment.reset();

        auto room = attachment.room.lock();
        if (!room) return;

        auto result = room->depart(attachment.playerId, conn.connectionId);
        if (!result.roomFound) return;

        broadcastPlayers(*room);

        // The reaper only catches what this path misses
        if (result.roomEmpty) {
            registry_.remove(attachment.sessionId, room);
        }
    }

    void disconnect(ConnectionContext& conn) {
        leaveRoom(conn);
    }

    // =========================================================================
    // Relay
    // =========================================================================

    /**
     * @brief Forward a WebRTC negotiation message to its target connection only.
     */
    void relaySignal(const ConnectionContext& conn, const SignalRequest& signal) {
        if (signal.target.empty()) return;

        if (signal.requestRenegotiate) {
            sendFunc_(signal.target, MessageCodec::createRenegotiate(conn.connectionId));
            return;
        }

        if (!signal.offer.is_null()) {
            if (auto room = attachedRoom(conn)) {
                room->addPeer(PeerLink{conn.connectionId, signal.target});
            }
        }
        sendFunc_(signal.target, MessageCodec::createSignal(conn.connectionId, signal));
    }

    /**
     * @brief Forward a gameplay payload to everyone else in the sender's room.
     */
    void relayToRoom(const ConnectionContext& conn, MessageType type, const nlohmann::json& payload) {
        auto room = attachedRoom(conn);
        if (!room) return;

        const std::string message = MessageCodec::createRelay(type, payload);
        room->broadcast(conn.connectionId, [this, &message](const std::string& connectionId) {
            sendFunc_(connectionId, message);
        });
    }

    // =========================================================================
    // Discovery
    // =========================================================================

    std::vector<RoomSummary> listOpen(const std::string& gameId) const {
        return registry_.listOpen(gameId);
    }

private:
    std::shared_ptr<Room> attachedRoom(const ConnectionContext& conn) const {
        if (!conn.attachment) return nullptr;
        auto room = conn.attachment->room.lock();
        if (!room || room->isClosed()) return nullptr;
        return room;
    }

    nlohmann::json broadcastPlayers(const Room& room) {
        return room.broadcastPlayers(
            [](const nlohmann::json& players) { return MessageCodec::createUsersUpdated(players); },
            sendFunc_);
    }

    RoomRegistry& registry_;
    SendFunc sendFunc_;
};

} // namespace netplay
