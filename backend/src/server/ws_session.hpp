#pragma once

#include <memory>
#include <string>
#include <queue>
#include <iostream>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/post.hpp>

#include "connection_directory.hpp"
#include "../protocol/message_handler.hpp"
#include "../protocol/message_codec.hpp"
#include "../services/session_coordinator.hpp"
#include "../utils/uuid.hpp"

namespace netplay {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * @brief Manages a single WebSocket connection.
 *
 * Inbound frames are handled one at a time, in arrival order, before the
 * next read is issued. All socket work runs on the connection's strand;
 * send() may be called from any thread and never blocks the caller.
 */
class WsSession : public std::enable_shared_from_this<WsSession> {
public:
    using Directory = ConnectionDirectory<WsSession>;

    WsSession(tcp::socket&& socket, SessionCoordinator& coordinator, Directory& directory)
        : ws_(std::move(socket))
        , coordinator_(coordinator)
        , directory_(directory)
        , messageHandler_(coordinator)
        , conn_(generateConnectionId())
        , isWriting_(false)
        , isClosed_(false)
    {}

    ~WsSession() {
        // Ensure cleanup on destruction
        directory_.remove(conn_.connectionId);
        coordinator_.disconnect(conn_);
    }

    /**
     * @brief Accept the WebSocket handshake for an already-read upgrade request, then read.
     */
    void runWithRequest(http::request<http::empty_body> const& req) {
        // Set suggested timeout settings for the websocket
        ws_.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::server));

        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "Netplay/1.0");
            }));

        ws_.read_message_max(ProtocolConstants::MaxMessageSize);

        ws_.async_accept(
            req,
            beast::bind_front_handler(&WsSession::onAccept, shared_from_this()));
    }

    /**
     * @brief Send a message to this session.
     */
    void send(const std::string& message) {
        net::post(ws_.get_executor(), [self = shared_from_this(), message]() {
            self->doSend(message);
        });
    }

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            return fail(ec, "accept");
        }

        directory_.add(conn_.connectionId, shared_from_this());
        doSend(MessageCodec::createConnected(conn_.connectionId));
        doRead();
    }

    void doRead() {
        if (isClosed_) return;

        ws_.async_read(
            buffer_,
            beast::bind_front_handler(&WsSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t bytesTransferred) {
        boost::ignore_unused(bytesTransferred);

        if (ec == websocket::error::closed) {
            return onDisconnect();
        }
        if (ec) {
            return fail(ec, "read");
        }

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (auto reply = messageHandler_.handle(conn_, message)) {
            doSend(*reply);
        }

        doRead();
    }

    /**
     * @brief Queue a message for sending. Must run on the strand.
     *
     * A peer that stops reading does not hold up its senders: once the queue
     * is full further messages to it are dropped.
     */
    void doSend(const std::string& message) {
        if (isClosed_) return;
        if (writeQueue_.size() >= ProtocolConstants::MaxQueuedMessages) return;

        writeQueue_.push(message);

        if (!isWriting_) {
            doWrite();
        }
    }

    void doWrite() {
        if (writeQueue_.empty() || isClosed_) {
            isWriting_ = false;
            return;
        }

        isWriting_ = true;
        currentWrite_ = std::move(writeQueue_.front());
        writeQueue_.pop();

        ws_.text(true);
        ws_.async_write(
            net::buffer(currentWrite_),
            beast::bind_front_handler(&WsSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t bytesTransferred) {
        boost::ignore_unused(bytesTransferred);

        if (ec) {
            return fail(ec, "write");
        }

        doWrite();
    }

    /**
     * @brief Leave the room and stop accepting outbound traffic. Idempotent.
     */
    void onDisconnect() {
        isClosed_ = true;
        std::queue<std::string>().swap(writeQueue_);
        directory_.remove(conn_.connectionId);
        coordinator_.disconnect(conn_);
    }

    void fail(beast::error_code ec, char const* what) {
        if (ec != net::error::operation_aborted &&
            ec != beast::error::timeout &&
            ec != net::error::eof &&
            ec != net::error::connection_reset) {
            std::cerr << "[" << conn_.connectionId << "] " << what << ": " << ec.message() << std::endl;
        }
        onDisconnect();
    }

    websocket::stream<beast::tcp_stream> ws_;
    SessionCoordinator& coordinator_;
    Directory& directory_;
    MessageHandler messageHandler_;
    ConnectionContext conn_;
    beast::flat_buffer buffer_;

    std::queue<std::string> writeQueue_;
    std::string currentWrite_;
    bool isWriting_;
    bool isClosed_;
};

using SessionDirectory = WsSession::Directory;

} // namespace netplay
