#pragma once

#include <memory>
#include <string>
#include <iostream>

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include "http_connection.hpp"
#include "ws_session.hpp"
#include "../services/session_coordinator.hpp"

namespace netplay {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * @brief TCP acceptor that hands each new connection to an HttpConnection for routing.
 */
class WsServer : public std::enable_shared_from_this<WsServer> {
public:
    WsServer(net::io_context& ioc, tcp::endpoint endpoint,
             SessionCoordinator& coordinator, SessionDirectory& directory)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , coordinator_(coordinator)
        , directory_(directory)
    {
        beast::error_code ec;

        // Open the acceptor
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            fail(ec, "open");
            return;
        }

        // Allow address reuse
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            fail(ec, "set_option");
            return;
        }

        // Bind to the server address
        acceptor_.bind(endpoint, ec);
        if (ec) {
            fail(ec, "bind");
            return;
        }

        // Start listening for connections
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            fail(ec, "listen");
            return;
        }

        listening_ = true;
        std::cout << "Netplay signaling server listening on " 
                  << endpoint.address().to_string() 
                  << ":" << endpoint.port() << std::endl;
    }

    /**
     * @brief Start accepting incoming connections.
     * @return false if the listening socket could not be set up
     */
    bool run() {
        if (!listening_) {
            return false;
        }
        doAccept();
        return true;
    }

    /**
     * @brief Stop accepting connections.
     */
    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

private:
    /**
     * @brief Start async accept for next connection.
     */
    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&WsServer::onAccept, shared_from_this()));
    }

    /**
     * @brief Called when a new connection is accepted.
     */
    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            fail(ec, "accept");
        } else {
            std::make_shared<HttpConnection>(std::move(socket), coordinator_, directory_)->run();
        }

        if (acceptor_.is_open()) {
            doAccept();
        }
    }

    /**
     * @brief Handle an error.
     */
    void fail(beast::error_code ec, char const* what) {
        std::cerr << what << ": " << ec.message() << std::endl;
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    SessionCoordinator& coordinator_;
    SessionDirectory& directory_;
    bool listening_ = false;
};

} // namespace netplay
