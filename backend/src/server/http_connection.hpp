#pragma once

/**
 * @file http_connection.hpp
 * @brief Handles the initial HTTP request - /health and /list get HTTP responses, upgrades go to WebSocket.
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <cctype>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "ws_session.hpp"
#include "../protocol/message_codec.hpp"
#include "../services/session_coordinator.hpp"

namespace netplay {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * @brief Handles the initial HTTP request. Routes GET /health and GET /list to
 *        plain HTTP responses and WebSocket upgrade requests to a WsSession.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket&& socket, SessionCoordinator& coordinator, SessionDirectory& directory)
        : socket_(std::move(socket))
        , coordinator_(coordinator)
        , directory_(directory)
    {}

    void run() {
        readRequest();
    }

    /**
     * @brief Value of a query parameter in a request target, percent-decoded.
     */
    static std::optional<std::string> queryParam(std::string_view target, std::string_view name) {
        auto q = target.find('?');
        if (q == std::string_view::npos) return std::nullopt;
        std::string_view query = target.substr(q + 1);

        while (!query.empty()) {
            auto amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            auto eq = pair.find('=');
            std::string_view key = pair.substr(0, eq);
            if (key == name) {
                return urlDecode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
            }
            if (amp == std::string_view::npos) break;
            query.remove_prefix(amp + 1);
        }
        return std::nullopt;
    }

    /**
     * @brief Path part of a request target (everything before '?').
     */
    static std::string_view path(std::string_view target) {
        return target.substr(0, target.find('?'));
    }

private:
    void readRequest() {
        parser_.emplace();
        parser_->body_limit(1024);

        http::async_read(
            socket_,
            buffer_,
            *parser_,
            beast::bind_front_handler(&HttpConnection::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            return;
        }

        auto& req = parser_->get();
        std::string_view target(req.target().data(), req.target().size());

        if (beast::websocket::is_upgrade(req)) {
            auto wsSession = std::make_shared<WsSession>(std::move(socket_), coordinator_, directory_);
            wsSession->runWithRequest(req);
            return;
        }

        if (req.method() == http::verb::get && path(target) == "/health") {
            return sendResponse(http::status::ok, "text/plain", "OK", req.version());
        }

        if (req.method() == http::verb::get && path(target) == "/list") {
            json rooms = json::object();
            if (auto gameId = queryParam(target, "game_id")) {
                rooms = MessageCodec::createRoomList(coordinator_.listOpen(*gameId));
            }
            return sendResponse(http::status::ok, "application/json", rooms.dump(), req.version());
        }

        sendResponse(http::status::not_found, "text/plain", "Not Found", req.version());
    }

    void sendResponse(http::status status, const char* contentType, std::string body, unsigned version) {
        auto res = std::make_shared<http::response<http::string_body>>(status, version);
        res->set(http::field::server, "Netplay/1.0");
        res->set(http::field::content_type, contentType);
        res->set(http::field::access_control_allow_origin, "*");
        res->keep_alive(false);
        res->body() = std::move(body);
        res->prepare_payload();

        auto self = shared_from_this();
        http::async_write(
            socket_,
            *res,
            [self, res](beast::error_code, std::size_t) {
                beast::error_code closeEc;
                self->socket_.shutdown(tcp::socket::shutdown_both, closeEc);
            });
    }

    static std::string urlDecode(std::string_view in) {
        std::string out;
        out.reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            char c = in[i];
            if (c == '+') {
                out.push_back(' ');
            } else if (c == '%' && i + 2 < in.size() &&
                       std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
                out.push_back(static_cast<char>(std::stoi(std::string(in.substr(i + 1, 2)), nullptr, 16)));
                i += 2;
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    tcp::socket socket_;
    SessionCoordinator& coordinator_;
    SessionDirectory& directory_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::empty_body>> parser_;
};

} // namespace netplay
