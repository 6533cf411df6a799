#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace partstream::downloader {

/**
 * Level-triggered readiness flag with coroutine waiters.
 *
 * A steady_timer parked at time_point::max() acts as the wait queue: set() cancels it,
 * which wakes every pending wait(). There is no timeout; a flag that is never set keeps
 * its waiters suspended.
 */
class ReadyEvent {
public:
    explicit ReadyEvent(boost::asio::any_io_executor executor, bool initiallySet = true)
        : timer_(std::move(executor)), set_(initiallySet) {
        timer_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    ReadyEvent(const ReadyEvent&) = delete;
    ReadyEvent& operator=(const ReadyEvent&) = delete;

    void set() {
        set_ = true;
        timer_.cancel();
    }

    void reset() {
        set_ = false;
        timer_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    [[nodiscard]] bool isSet() const noexcept { return set_; }

    boost::asio::awaitable<void> wait() {
        while (!set_) {
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

private:
    boost::asio::steady_timer timer_;
    bool set_;
};

} // namespace partstream::downloader
