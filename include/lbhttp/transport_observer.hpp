#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include "lbhttp/error.hpp"
#include "lbhttp/logging.hpp"

namespace lbhttp {

    /**
     * @brief Observes the life of one transport connection.
     *
     * Callbacks run on the I/O thread and must not block.
     */
    class TransportObserver {
       public:
        virtual ~TransportObserver() = default;

        virtual void on_new_connection(
            boost::asio::ip::tcp::endpoint const& /*remote*/) {}
        virtual void on_connection_established() {}
        virtual void on_connection_closed(
            std::optional<Error> const& /*cause*/) {}
    };

    class NoopTransportObserver final : public TransportObserver {
       public:
        static std::shared_ptr<TransportObserver> instance() {
            static std::shared_ptr<TransportObserver> inst =
                std::make_shared<NoopTransportObserver>();
            return inst;
        }
    };

    /**
     * @brief Wraps a user observer so an exception thrown from a callback is
     * logged instead of unwinding through transport code.
     */
    class SafeTransportObserver final : public TransportObserver {
       public:
        explicit SafeTransportObserver(
            std::shared_ptr<TransportObserver> delegate)
            : delegate_(std::move(delegate)) {}

        void on_new_connection(
            boost::asio::ip::tcp::endpoint const& remote) override {
            guard("on_new_connection",
                  [&] { delegate_->on_new_connection(remote); });
        }

        void on_connection_established() override {
            guard("on_connection_established",
                  [&] { delegate_->on_connection_established(); });
        }

        void on_connection_closed(
            std::optional<Error> const& cause) override {
            guard("on_connection_closed",
                  [&] { delegate_->on_connection_closed(cause); });
        }

       private:
        template <typename F>
        void guard(const char* what, F&& f) noexcept {
            try {
                std::forward<F>(f)();
            } catch (const std::exception& e) {
                logger()->warn("transport observer {} threw: {}", what,
                               e.what());
            } catch (...) {
                logger()->warn("transport observer {} threw a non-exception",
                               what);
            }
        }

        std::shared_ptr<TransportObserver> delegate_;
    };

    /// @brief nullptr -> no-op observer, anything else -> safe wrapper.
    inline std::shared_ptr<TransportObserver> as_safe_observer(
        std::shared_ptr<TransportObserver> observer) {
        if (!observer) return NoopTransportObserver::instance();
        if (std::dynamic_pointer_cast<SafeTransportObserver>(observer) ||
            std::dynamic_pointer_cast<NoopTransportObserver>(observer)) {
            return observer;
        }
        return std::make_shared<SafeTransportObserver>(std::move(observer));
    }

}  // namespace lbhttp
