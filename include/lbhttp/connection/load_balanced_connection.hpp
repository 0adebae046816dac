#pragma once

#include <memory>
#include <mutex>

#include "lbhttp/connection/concurrency_controller.hpp"
#include "lbhttp/connection/connection.hpp"
#include "lbhttp/execution_strategy.hpp"

namespace lbhttp {

    /**
     * @brief The connection handed to load balancers and clients: a
     * filtered, protocol-bound connection gated by its concurrency
     * controller.
     *
     * Immutable after construction. Gating is the caller's job: take a
     * permit with try_request() (or the reservation with try_reserve())
     * before request(), and drop it when the exchange is done.
     */
    class LoadBalancedStreamingHttpConnection final
        : public StreamingHttpConnectionFilter {
       public:
        using Controller = ReservableRequestConcurrencyController;

        LoadBalancedStreamingHttpConnection(
            std::shared_ptr<FilterableStreamingHttpConnection> bound,
            std::shared_ptr<Controller> controller,
            HttpExecutionStrategy strategy);

        /// @brief Carries the strategy this connection was created with.
        HttpExecutionContext const& execution_context() const override {
            return exec_;
        }

        HttpExecutionStrategy strategy() const noexcept {
            return exec_.strategy;
        }

        Controller::Permit try_request() { return controller_->try_acquire(); }

        Controller::Permit try_request(AcquireOutcome& outcome) {
            return controller_->try_acquire(outcome);
        }

        Controller::Reservation try_reserve() {
            return controller_->try_reserve();
        }

        Controller& controller() const noexcept { return *controller_; }

       private:
        std::shared_ptr<Controller> controller_;
        HttpExecutionContext exec_;
    };

    /**
     * @brief A LoadBalancedStreamingHttpConnection held under its
     * controller's reservation.
     *
     * Requests go straight to the connection: the reservation already
     * excludes ordinary permits. release_async() gives the reservation back
     * and leaves the connection open; this handle rejects requests from
     * then on.
     */
    class ReservedLoadBalancedConnection final
        : public ReservedStreamingHttpConnection {
       public:
        ReservedLoadBalancedConnection(
            std::shared_ptr<LoadBalancedStreamingHttpConnection> conn,
            LoadBalancedStreamingHttpConnection::Controller::Reservation
                reservation)
            : conn_(std::move(conn)), reservation_(std::move(reservation)) {}

        boost::asio::awaitable<Result<StreamingHttpResponse>> request(
            StreamingHttpRequest req) override {
            if (!reserved()) {
                co_return Result<StreamingHttpResponse>::err(
                    Error::Code::Rejected, "reservation released");
            }
            co_return co_await conn_->request(std::move(req));
        }

        ConnectionContext& connection_context() override {
            return conn_->connection_context();
        }
        TransportEventRegistry& transport_events() override {
            return conn_->transport_events();
        }
        HttpExecutionContext const& execution_context() const override {
            return conn_->execution_context();
        }
        CloseNotifier& on_close() override { return conn_->on_close(); }

        boost::asio::awaitable<Status> close_async() override;
        boost::asio::awaitable<Status> close_async_gracefully() override;
        boost::asio::awaitable<Status> release_async() override;

        /// @brief True until release or close.
        bool reserved() const {
            std::lock_guard<std::mutex> lk(mu_);
            return static_cast<bool>(reservation_);
        }

       private:
        void drop_reservation() {
            std::lock_guard<std::mutex> lk(mu_);
            reservation_.release();
        }

        std::shared_ptr<LoadBalancedStreamingHttpConnection> conn_;
        mutable std::mutex mu_;
        LoadBalancedStreamingHttpConnection::Controller::Reservation
            reservation_;
    };

}  // namespace lbhttp
