#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>

namespace lbhttp {

    /**
     * Ticketed FIFO gate for coroutines.
     *
     * Ticket n passes once tickets 0..n-1 have called advance(). A waiter
     * parks on its own timer; advance() cancels the next ticket's timer to
     * wake it.
     *
     * SAFETY: not thread-safe. All calls must come from one strand.
     */
    class Turnstile {
       public:
        explicit Turnstile(boost::asio::any_io_executor ex)
            : ex_(std::move(ex)) {}

        boost::asio::awaitable<void> wait_turn(std::uint64_t ticket) {
            while (serving_ != ticket) {
                auto t = std::make_shared<boost::asio::steady_timer>(ex_);
                t->expires_at(std::chrono::steady_clock::time_point::max());
                waiters_[ticket] = t;

                // Only cancellation wakes us; the loop re-checks the turn.
                boost::system::error_code ec;
                co_await t->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                waiters_.erase(ticket);
            }
        }

        /// @brief Let the next ticket through.
        void advance() {
            ++serving_;
            auto it = waiters_.find(serving_);
            if (it != waiters_.end()) it->second->cancel();
        }

        std::uint64_t serving() const noexcept { return serving_; }

       private:
        boost::asio::any_io_executor ex_;
        std::uint64_t serving_{0};
        std::map<std::uint64_t, std::shared_ptr<boost::asio::steady_timer>>
            waiters_;
    };

}  // namespace lbhttp
