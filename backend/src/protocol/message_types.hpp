// Message Types - Enum for all message types


#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <stdexcept>

namespace netplay {

/**
 * @brief Enumeration of all WebSocket message types in the protocol.
 *
 * Messages are categorized as:
 * - Control: Room management (open, join, leave, membership updates)
 * - Signaling: Point-to-point WebRTC negotiation relay
 * - Gameplay: Room-wide opaque relay (data, snapshots, inputs)
 * - Heartbeat: Connection health checks
 */

enum class MessageType {
   // Control messages (reliable, low frequency)
   OpenRoom,       // Client -> Server: Create a room and become its owner
   JoinRoom,       // Client -> Server: Request to join an existing room
   LeaveRoom,      // Client -> Server: Leave the current room
   UsersUpdated,   // Server -> Room: Full players mapping after a change
   Ack,            // Server -> Client: Response to a control request
   Connected,      // Server -> Client: Assigned connection id

   // Signaling messages (point-to-point)
   WebrtcSignal,   // Bidirectional: offer/answer/candidate/renegotiate

   // Gameplay messages (room broadcast minus sender)
   DataMessage,
   Snapshot,
   Input,

   // Heartbeat messages (reliable, periodic)
   Ping,           // Client -> Server: Keep-alive request
   Pong,           // Server -> Client: Keep-alive response

   // Error messages
   Error,          // Server -> Client: Error notification

   // Unknown/Invalid
   Unknown         // Parsing failed or unrecognized type
};

/**
 * @brief Error codes for protocol-level errors.
 */
enum class ErrorCode {
    // Request errors
    InvalidRequest,     // Session or player identifier missing
    RoomAlreadyExists,  // Session id already taken by a live room
    RoomNotFound,       // Requested room does not exist
    IncorrectPassword,  // Wrong or missing room password
    RoomFull,           // Room has reached its player capacity

    // Message errors
    MalformedMessage,   // JSON parsing failed
    InvalidMessageType, // Unknown message type

    // Internal errors
    InternalError       // Unexpected server error
};

// =============================================================================
// String Constants for JSON Serialization
// =============================================================================

namespace MessageTypeStrings {
    constexpr std::string_view OpenRoom     = "open-room";
    constexpr std::string_view JoinRoom     = "join-room";
    constexpr std::string_view LeaveRoom    = "leave-room";
    constexpr std::string_view UsersUpdated = "users-updated";
    constexpr std::string_view Ack          = "ack";
    constexpr std::string_view Connected    = "connected";
    constexpr std::string_view WebrtcSignal = "webrtc-signal";
    constexpr std::string_view DataMessage  = "data-message";
    constexpr std::string_view Snapshot     = "snapshot";
    constexpr std::string_view Input        = "input";
    constexpr std::string_view Ping         = "ping";
    constexpr std::string_view Pong         = "pong";
    constexpr std::string_view Error        = "error";
}

namespace ErrorCodeStrings {
    constexpr std::string_view InvalidRequest     = "INVALID_REQUEST";
    constexpr std::string_view RoomAlreadyExists  = "ROOM_ALREADY_EXISTS";
    constexpr std::string_view RoomNotFound       = "ROOM_NOT_FOUND";
    constexpr std::string_view IncorrectPassword  = "INCORRECT_PASSWORD";
    constexpr std::string_view RoomFull           = "ROOM_FULL";
    constexpr std::string_view MalformedMessage   = "MALFORMED_MESSAGE";
    constexpr std::string_view InvalidMessageType = "INVALID_MESSAGE_TYPE";
    constexpr std::string_view InternalError      = "INTERNAL_ERROR";
}

// =============================================================================
// Conversion Functions
// =============================================================================

/**
 * @brief Convert a string to MessageType enum.
 * @param typeStr The JSON "type" field value
 * @return Corresponding MessageType, or MessageType::Unknown if not recognized
 */
inline MessageType stringToMessageType(std::string_view typeStr) {
    static const std::unordered_map<std::string_view, MessageType> mapping = {
        {MessageTypeStrings::OpenRoom,     MessageType::OpenRoom},
        {MessageTypeStrings::JoinRoom,     MessageType::JoinRoom},
        {MessageTypeStrings::LeaveRoom,    MessageType::LeaveRoom},
        {MessageTypeStrings::UsersUpdated, MessageType::UsersUpdated},
        {MessageTypeStrings::Ack,          MessageType::Ack},
        {MessageTypeStrings::Connected,    MessageType::Connected},
        {MessageTypeStrings::WebrtcSignal, MessageType::WebrtcSignal},
        {MessageTypeStrings::DataMessage,  MessageType::DataMessage},
        {MessageTypeStrings::Snapshot,     MessageType::Snapshot},
        {MessageTypeStrings::Input,        MessageType::Input},
        {MessageTypeStrings::Ping,         MessageType::Ping},
        {MessageTypeStrings::Pong,         MessageType::Pong},
        {MessageTypeStrings::Error,        MessageType::Error}
    };

    auto it = mapping.find(typeStr);
    return (it != mapping.end()) ? it->second : MessageType::Unknown;
}

/**
 * @brief Convert MessageType enum to string for JSON serialization.
 * @param type The MessageType enum value
 * @return String representation for JSON "type" field
 * @throws std::invalid_argument if MessageType::Unknown is passed
 */
inline std::string_view messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::OpenRoom:     return MessageTypeStrings::OpenRoom;
        case MessageType::JoinRoom:     return MessageTypeStrings::JoinRoom;
        case MessageType::LeaveRoom:    return MessageTypeStrings::LeaveRoom;
        case MessageType::UsersUpdated: return MessageTypeStrings::UsersUpdated;
        case MessageType::Ack:          return MessageTypeStrings::Ack;
        case MessageType::Connected:    return MessageTypeStrings::Connected;
        case MessageType::WebrtcSignal: return MessageTypeStrings::WebrtcSignal;
        case MessageType::DataMessage:  return MessageTypeStrings::DataMessage;
        case MessageType::Snapshot:     return MessageTypeStrings::Snapshot;
        case MessageType::Input:        return MessageTypeStrings::Input;
        case MessageType::Ping:         return MessageTypeStrings::Ping;
        case MessageType::Pong:         return MessageTypeStrings::Pong;
        case MessageType::Error:        return MessageTypeStrings::Error;
        case MessageType::Unknown:
        default:
            throw std::invalid_argument("Cannot convert Unknown message type to string");
    }
}

/**
 * @brief True for the gameplay messages that are relayed to the rest of a room.
 */
inline bool isRoomRelayType(MessageType type) {
    return type == MessageType::DataMessage ||
           type == MessageType::Snapshot ||
           type == MessageType::Input;
}

/**
 * @brief Convert ErrorCode enum to string for JSON serialization.
 * @param code The ErrorCode enum value
 * @return String representation for JSON error code field
 */
inline std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:     return ErrorCodeStrings::InvalidRequest;
        case ErrorCode::RoomAlreadyExists:  return ErrorCodeStrings::RoomAlreadyExists;
        case ErrorCode::RoomNotFound:       return ErrorCodeStrings::RoomNotFound;
        case ErrorCode::IncorrectPassword:  return ErrorCodeStrings::IncorrectPassword;
        case ErrorCode::RoomFull:           return ErrorCodeStrings::RoomFull;
        case ErrorCode::MalformedMessage:   return ErrorCodeStrings::MalformedMessage;
        case ErrorCode::InvalidMessageType: return ErrorCodeStrings::InvalidMessageType;
        case ErrorCode::InternalError:
        default:
            return ErrorCodeStrings::InternalError;
    }
}

/**
 * @brief Get a human-readable message for an error code.
 *
 * Room errors keep the wording netplay clients already match on.
 */
inline std::string_view errorCodeToMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:
            return "Invalid data";
        case ErrorCode::RoomAlreadyExists:
            return "Room already exists";
        case ErrorCode::RoomNotFound:
            return "Room not found";
        case ErrorCode::IncorrectPassword:
            return "Incorrect password";
        case ErrorCode::RoomFull:
            return "Room full";
        case ErrorCode::MalformedMessage:
            return "Message format is invalid";
        case ErrorCode::InvalidMessageType:
            return "Unknown message type";
        case ErrorCode::InternalError:
        default:
            return "An unexpected error occurred";
    }
}

// =============================================================================
// Protocol Constants
// =============================================================================

namespace ProtocolConstants {
    // Room defaults
    constexpr int DefaultMaxPlayers = 4;
    constexpr std::string_view DefaultGameId = "default";
    constexpr std::string_view DefaultDomain = "unknown";
    constexpr std::string_view UnknownOwnerName = "Unknown";

    // Registry partitioning
    constexpr size_t RegistryShardCount = 16;

    // Message limits
    constexpr size_t MaxMessageSize = 1024 * 1024;  // 1 MB (snapshots can be large)
    constexpr size_t MaxQueuedMessages = 1024;      // per connection, beyond this sends are dropped

    // Timing
    constexpr int ReaperIntervalSeconds = 60;
}

} // namespace netplay
