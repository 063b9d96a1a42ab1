#pragma once

#include <string>
#include <optional>

#include "message_types.hpp"
#include "message_codec.hpp"
#include "../services/session_coordinator.hpp"

namespace netplay {

/**
 * @brief Dispatches parsed messages to the session coordinator.
 */
class MessageHandler {
public:
    explicit MessageHandler(SessionCoordinator& coordinator)
        : coordinator_(coordinator)
    {}

    /**
     * @brief Handle an incoming message from a connection.
     * @param conn The sending connection's state
     * @param rawMessage The raw JSON message string
     * @return Reply for the sender (ack, pong or error), nullopt if none
     */
    std::optional<std::string> handle(ConnectionContext& conn, const std::string& rawMessage) {
        json msg;
        try {
            msg = MessageCodec::parse(rawMessage);
        } catch (const MessageParseError&) {
            return MessageCodec::createError(ErrorCode::MalformedMessage, 0);
        }

        MessageType type = MessageCodec::getType(msg);
        uint64_t seq = MessageCodec::getSeq(msg);

        if (isRoomRelayType(type)) {
            coordinator_.relayToRoom(conn, type, MessageCodec::getPayload(msg));
            return std::nullopt;
        }

        json data = MessageCodec::getData(msg);

        switch (type) {
            case MessageType::OpenRoom:
                return handleOpenRoom(conn, seq, data);

            case MessageType::JoinRoom:
                return handleJoinRoom(conn, seq, data);

            case MessageType::LeaveRoom:
                coordinator_.leaveRoom(conn);
                return MessageCodec::createAck(seq, std::nullopt);

            case MessageType::WebrtcSignal:
                coordinator_.relaySignal(conn, MessageCodec::parseSignal(data));
                return std::nullopt;

            case MessageType::Ping:
                return MessageCodec::createPong(seq);

            case MessageType::Unknown:
            default:
                return MessageCodec::createError(ErrorCode::InvalidMessageType, seq);
        }
    }

private:
    /**
     * @brief Handle open-room message.
     */
    std::string handleOpenRoom(ConnectionContext& conn, uint64_t seq, const json& data) {
        auto request = MessageCodec::parseOpenRoomRequest(data);
        if (!request) {
            return MessageCodec::createAck(seq, ErrorCode::InvalidRequest);
        }
        return MessageCodec::createAck(seq, coordinator_.openRoom(conn, *request));
    }

    /**
     * @brief Handle join-room message.
     */
    std::string handleJoinRoom(ConnectionContext& conn, uint64_t seq, const json& data) {
        auto request = MessageCodec::parseRoomRequest(data);
        if (!request) {
            return MessageCodec::createAck(seq, ErrorCode::InvalidRequest);
        }

        auto result = coordinator_.joinRoom(conn, *request);
        if (!result.success) {
            return MessageCodec::createAck(seq, result.errorCode);
        }
        return MessageCodec::createAck(seq, std::nullopt, result.players);
    }

    SessionCoordinator& coordinator_;
};

} // namespace netplay
