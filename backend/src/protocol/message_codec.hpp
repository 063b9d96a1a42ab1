#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "message_types.hpp"
#include "../models/room.hpp"

namespace netplay {

using json = nlohmann::json;

/**
 * @brief Exception for message parsing errors.
 */
class MessageParseError : public std::runtime_error {
public:
    explicit MessageParseError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief Decoded open-room / join-room request.
 */
struct RoomRequest {
    std::string sessionId;
    std::string playerId;
    json extra = json::object();
    std::optional<std::string> password;
    size_t maxPlayers = ProtocolConstants::DefaultMaxPlayers;
};

/**
 * @brief Decoded webrtc-signal request. Payload fields are opaque.
 */
struct SignalRequest {
    std::string target;
    json candidate;
    json offer;
    json answer;
    bool requestRenegotiate = false;
};

/**
 * @brief Handles JSON serialization and deserialization of protocol messages.
 */
class MessageCodec {
public:
    // =========================================================================
    // Parsing (Incoming Messages)
    // =========================================================================

    /**
     * @brief Parse a raw JSON string into a json object.
     * @throws MessageParseError if JSON is invalid or not an object
     */
    static json parse(const std::string& rawMessage) {
        json msg;
        try {
            msg = json::parse(rawMessage);
        } catch (const json::parse_error& e) {
            throw MessageParseError("Invalid JSON: " + std::string(e.what()));
        }
        if (!msg.is_object()) {
            throw MessageParseError("Message is not a JSON object");
        }
        return msg;
    }

    /**
     * @brief Extract message type from parsed JSON.
     */
    static MessageType getType(const json& msg) {
        if (!msg.contains("type") || !msg["type"].is_string()) {
            return MessageType::Unknown;
        }
        return stringToMessageType(msg["type"].get<std::string>());
    }

    /**
     * @brief Extract sequence number from parsed JSON.
     */
    static uint64_t getSeq(const json& msg) {
        if (!msg.contains("seq") || !msg["seq"].is_number_unsigned()) {
            return 0;
        }
        return msg["seq"].get<uint64_t>();
    }

    /**
     * @brief Extract data payload from parsed JSON.
     */
    static json getData(const json& msg) {
        if (!msg.contains("data") || !msg["data"].is_object()) {
            return json::object();
        }
        return msg["data"];
    }

    /**
     * @brief Extract the data field as-is for opaque relay (null if absent).
     */
    static json getPayload(const json& msg) {
        auto it = msg.find("data");
        return (it != msg.end()) ? *it : json();
    }

    // =========================================================================
    // Request Decoding
    // =========================================================================

    /**
     * @brief Read an identifier that may be sent as a string or an integer.
     * @return The identifier, or nullopt if absent or empty
     */
    static std::optional<std::string> extractId(const json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end()) return std::nullopt;
        if (it->is_string()) {
            auto value = it->get<std::string>();
            if (value.empty()) return std::nullopt;
            return value;
        }
        if (it->is_number_integer()) {
            return it->dump();
        }
        return std::nullopt;
    }

    /**
     * @brief Decode the data of a join-room message (also the common part of open-room).
     *
     * Session id comes from extra.sessionid, player id from extra.userid or
     * extra.playerId. An empty or null password means an open room; a numeric
     * password is compared in its decimal form.
     *
     * @return nullopt if an identifier is missing or the password is not a string or number
     */
    static std::optional<RoomRequest> parseRoomRequest(const json& data) {
        RoomRequest request;
        if (data.contains("extra") && data["extra"].is_object()) {
            request.extra = data["extra"];
        }

        auto sessionId = extractId(request.extra, "sessionid");
        auto playerId = extractId(request.extra, "userid");
        if (!playerId) {
            playerId = extractId(request.extra, "playerId");
        }
        if (!sessionId || !playerId) {
            return std::nullopt;
        }
        request.sessionId = *sessionId;
        request.playerId = *playerId;

        auto pwd = data.find("password");
        if (pwd != data.end() && !pwd->is_null()) {
            if (pwd->is_string()) {
                if (!pwd->get<std::string>().empty()) {
                    request.password = pwd->get<std::string>();
                }
            } else if (pwd->is_number()) {
                request.password = pwd->dump();
            } else {
                return std::nullopt;
            }
        }
        return request;
    }

    /**
     * @brief Decode the data of an open-room message: the join fields plus capacity.
     *
     * A maxPlayers of 0 or null selects the default capacity.
     *
     * @return nullopt if the join fields are invalid or maxPlayers is not a non-negative integer
     */
    static std::optional<RoomRequest> parseOpenRoomRequest(const json& data) {
        auto request = parseRoomRequest(data);
        if (!request) {
            return std::nullopt;
        }

        auto maxPlayers = data.find("maxPlayers");
        if (maxPlayers != data.end() && !maxPlayers->is_null()) {
            if (!maxPlayers->is_number_integer()) {
                return std::nullopt;
            }
            auto value = maxPlayers->get<int64_t>();
            if (value < 0) {
                return std::nullopt;
            }
            if (value > 0) {
                request->maxPlayers = static_cast<size_t>(value);
            }
        }
        return request;
    }

    /**
     * @brief Room settings carried by an open-room request.
     */
    static RoomSettings toRoomSettings(const RoomRequest& request) {
        RoomSettings settings;
        settings.roomName = stringOr(request.extra, "room_name", "");
        settings.gameId = stringOr(request.extra, "game_id", std::string(ProtocolConstants::DefaultGameId));
        settings.domain = stringOr(request.extra, "domain", std::string(ProtocolConstants::DefaultDomain));
        settings.password = request.password;
        settings.maxPlayers = request.maxPlayers;
        return settings;
    }

    /**
     * @brief Decode a webrtc-signal message. Fields absent from data stay null.
     */
    static SignalRequest parseSignal(const json& data) {
        SignalRequest signal;
        if (auto target = extractId(data, "target")) {
            signal.target = *target;
        }
        signal.candidate = fieldOrNull(data, "candidate");
        signal.offer = fieldOrNull(data, "offer");
        signal.answer = fieldOrNull(data, "answer");

        auto reneg = data.find("requestRenegotiate");
        signal.requestRenegotiate = reneg != data.end() && reneg->is_boolean() && reneg->get<bool>();
        return signal;
    }

    // =========================================================================
    // Message Creation (Outgoing Messages)
    // =========================================================================

    /**
     * @brief Create base message structure.
     */
    static json createMessage(MessageType type, uint64_t seq, const json& data) {
        return {
            {"type", std::string(messageTypeToString(type))},
            {"seq", seq},
            {"timestamp", currentTimestampMs()},
            {"data", data}
        };
    }

    /**
     * @brief Create users-updated message carrying the full players mapping.
     */
    static std::string createUsersUpdated(const json& players) {
        return createMessage(MessageType::UsersUpdated, 0, players).dump();
    }

    /**
     * @brief Create the acknowledgement for a control request.
     * @param seq The request's sequence number
     * @param error Error to report, nullopt on success
     * @param players Players mapping to return on a successful join
     */
    static std::string createAck(uint64_t seq,
                                 const std::optional<ErrorCode>& error,
                                 const std::optional<json>& players = std::nullopt) {
        json data = {{"ok", !error.has_value()}};
        if (error) {
            data["error"] = {
                {"code", std::string(errorCodeToString(*error))},
                {"message", std::string(errorCodeToMessage(*error))}
            };
        }
        if (players) {
            data["players"] = *players;
        }
        return createMessage(MessageType::Ack, seq, data).dump();
    }

    /**
     * @brief Create the greeting that tells a client its connection id.
     */
    static std::string createConnected(const std::string& connectionId) {
        json data = {{"connectionId", connectionId}};
        return createMessage(MessageType::Connected, 0, data).dump();
    }

    /**
     * @brief Create a relayed webrtc-signal. Only fields the sender supplied are included.
     */
    static std::string createSignal(const std::string& senderId, const SignalRequest& signal) {
        json data = {{"sender", senderId}};
        if (!signal.candidate.is_null()) data["candidate"] = signal.candidate;
        if (!signal.offer.is_null()) data["offer"] = signal.offer;
        if (!signal.answer.is_null()) data["answer"] = signal.answer;
        return createMessage(MessageType::WebrtcSignal, 0, data).dump();
    }

    /**
     * @brief Create a renegotiation request for a peer.
     */
    static std::string createRenegotiate(const std::string& senderId) {
        json data = {
            {"sender", senderId},
            {"requestRenegotiate", true}
        };
        return createMessage(MessageType::WebrtcSignal, 0, data).dump();
    }

    /**
     * @brief Create a data-message / snapshot / input relay with the payload untouched.
     */
    static std::string createRelay(MessageType type, const json& payload) {
        return createMessage(type, 0, payload).dump();
    }

    /**
     * @brief Create pong message.
     */
    static std::string createPong(uint64_t seq) {
        return createMessage(MessageType::Pong, seq, json::object()).dump();
    }

    /**
     * @brief Create error message.
     */
    static std::string createError(ErrorCode code, uint64_t seq) {
        json data = {
            {"code", std::string(errorCodeToString(code))},
            {"message", std::string(errorCodeToMessage(code))}
        };
        return createMessage(MessageType::Error, seq, data).dump();
    }

    /**
     * @brief Discovery listing: sessionId -> {room_name, current, max, player_name, hasPassword}.
     */
    static json createRoomList(const std::vector<RoomSummary>& rooms) {
        json list = json::object();
        for (const auto& room : rooms) {
            list[room.sessionId] = {
                {"room_name", room.roomName},
                {"current", room.currentCount},
                {"max", room.maxPlayers},
                {"player_name", room.ownerDisplayName},
                {"hasPassword", room.hasPassword}
            };
        }
        return list;
    }

private:
    static json fieldOrNull(const json& obj, const char* key) {
        auto it = obj.find(key);
        return (it != obj.end()) ? *it : json();
    }

    static std::string stringOr(const json& obj, const char* key, const std::string& fallback) {
        auto it = obj.find(key);
        if (it == obj.end()) return fallback;
        if (it->is_string()) {
            auto value = it->get<std::string>();
            return value.empty() ? fallback : value;
        }
        if (it->is_number()) return it->dump();
        return fallback;
    }

    /**
     * @brief Get current timestamp in milliseconds.
     */
    static int64_t currentTimestampMs() {
        auto now = std::chrono::system_clock::now();
        auto duration = now.time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    }
};

} // namespace netplay
