#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "lbhttp/config.hpp"
#include "lbhttp/connection/connection_factory.hpp"
#include "lbhttp/connection/load_balanced_connection.hpp"
#include "lbhttp/request.hpp"
#include "lbhttp/response.hpp"
#include "lbhttp/result.hpp"

namespace lbhttp {

    /**
     * @brief Asynchronous HTTP client surface the blocking adapter wraps.
     */
    class StreamingHttpClient {
       public:
        virtual ~StreamingHttpClient() = default;

        virtual boost::asio::awaitable<Result<StreamingHttpResponse>> request(
            StreamingHttpRequest req) = 0;

        /// @brief Reserve one connection for exclusive use.
        virtual boost::asio::awaitable<
            Result<std::shared_ptr<ReservedStreamingHttpConnection>>>
        reserve_connection(HttpRequestMetaData meta) = 0;

        virtual HttpExecutionContext const& execution_context() const = 0;

        virtual HttpRequestResponseFactory const& request_response_factory()
            const = 0;

        /// @brief Idempotent.
        virtual boost::asio::awaitable<Status> close_async() = 0;
        virtual boost::asio::awaitable<Status> close_async_gracefully() = 0;
    };

    /**
     * A client bound to one resolved address.
     *
     * Keeps up to max_connections connections from an
     * LBHttpConnectionFactory and sends each request on the first one whose
     * controller grants a permit, opening a new connection when none does.
     * A caller that finds the limit taken up by connects still in flight
     * waits for one of them to settle before deciding.
     *
     * SAFETY:
     * - Thread-safe; the connection list is guarded by a mutex.
     * - Waiters park on timers owned by a strand, so a wake-up is never
     *   lost between registering and waiting.
     *
     * ERRORS:
     * - Rejected: every connection is busy, the limit is reached and no
     *   connect is in flight
     * - ConnectionClosed: the client is closed
     * - anything the factory or the connection reports
     */
    class SingleAddressStreamingHttpClient final : public StreamingHttpClient {
       public:
        /// @throws std::invalid_argument on a null factory or
        /// max_connections == 0.
        SingleAddressStreamingHttpClient(
            std::shared_ptr<LBHttpConnectionFactory> factory,
            tcp::endpoint address, HttpClientConfiguration cfg);

        /// @brief Client over plain TCP connections to address.
        static std::shared_ptr<SingleAddressStreamingHttpClient> create_tcp(
            HttpExecutionContext exec, tcp::endpoint address,
            HttpClientConfiguration cfg,
            ExecutionStrategy connect_strategy = ExecutionStrategy::connect(false));

        boost::asio::awaitable<Result<StreamingHttpResponse>> request(
            StreamingHttpRequest req) override;

        boost::asio::awaitable<
            Result<std::shared_ptr<ReservedStreamingHttpConnection>>>
        reserve_connection(HttpRequestMetaData meta) override;

        HttpExecutionContext const& execution_context() const override {
            return factory_->execution_context();
        }

        HttpRequestResponseFactory const& request_response_factory()
            const override {
            return req_res_factory_;
        }

        boost::asio::awaitable<Status> close_async() override;
        boost::asio::awaitable<Status> close_async_gracefully() override;

        /// @brief Connections currently held (closed ones are pruned lazily).
        std::size_t connection_count() const;

       private:
        using LbConnection = std::shared_ptr<LoadBalancedStreamingHttpConnection>;
        enum class Pick { Permit, Reservation };

        /// Callers waiting for an in-flight connect. timers is strand-only.
        struct ConnectWaiters {
            explicit ConnectWaiters(boost::asio::io_context::executor_type ex)
                : strand(ex) {}

            boost::asio::strand<boost::asio::io_context::executor_type> strand;
            std::vector<std::shared_ptr<boost::asio::steady_timer>> timers;
        };

        /// Holds whichever grant select() obtained.
        struct Selected {
            LbConnection conn;
            LoadBalancedStreamingHttpConnection::Controller::Permit permit;
            LoadBalancedStreamingHttpConnection::Controller::Reservation
                reservation;
        };

        boost::asio::awaitable<Result<Selected>> select(
            Pick pick, ContextMap const& context);

        bool try_grant_locked(Pick pick, Selected& out);

        /// Runs on the waiters' strand. Returns once connects_settled_ moves
        /// past settled or the client closes.
        boost::asio::awaitable<void> wait_for_connect(std::uint64_t settled);
        void wake_connect_waiters();

        boost::asio::awaitable<Status> close_all(bool graceful);

        std::shared_ptr<LBHttpConnectionFactory> factory_;
        tcp::endpoint address_;
        HttpClientConfiguration cfg_;
        HttpRequestResponseFactory req_res_factory_;

        mutable std::mutex mu_;
        std::vector<LbConnection> connections_;
        std::size_t pending_{0};
        std::uint64_t connects_settled_{0};
        bool closed_{false};

        std::shared_ptr<ConnectWaiters> waiters_;
    };

}  // namespace lbhttp
