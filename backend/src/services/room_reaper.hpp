#pragma once

#include <memory>
#include <chrono>
#include <iostream>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include "room_registry.hpp"

namespace netplay {

/**
 * @brief Periodically deletes rooms left with no players.
 *
 * Leave and disconnect delete rooms directly; the sweep only catches rooms
 * that emptied without either event being handled.
 */
class RoomReaper : public std::enable_shared_from_this<RoomReaper> {
public:
    RoomReaper(boost::asio::io_context& ioc, RoomRegistry& registry, std::chrono::seconds interval)
        : timer_(boost::asio::make_strand(ioc))
        , registry_(registry)
        , interval_(interval)
    {}

    void run() {
        schedule();
    }

    void stop() {
        boost::asio::post(timer_.get_executor(), [self = shared_from_this()]() {
            self->stopped_ = true;
            self->timer_.cancel();
        });
    }

private:
    void schedule() {
        if (stopped_) return;
        timer_.expires_after(interval_);
        timer_.async_wait(
            boost::beast::bind_front_handler(&RoomReaper::onTimer, shared_from_this()));
    }

    void onTimer(boost::system::error_code ec) {
        if (ec == boost::asio::error::operation_aborted || stopped_) {
            return;
        }

        size_t removed = registry_.sweepEmpty();
        if (removed > 0) {
            std::cout << "Reaper removed " << removed << " empty room(s), "
                      << registry_.size() << " active" << std::endl;
        }
        schedule();
    }

    boost::asio::steady_timer timer_;
    RoomRegistry& registry_;
    std::chrono::seconds interval_;
    bool stopped_ = false;
};

} // namespace netplay
