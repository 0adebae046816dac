#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "lbhttp/config.hpp"
#include "lbhttp/connection/connection.hpp"
#include "lbhttp/connection/load_balanced_connection.hpp"
#include "lbhttp/context_map.hpp"
#include "lbhttp/execution_strategy.hpp"
#include "lbhttp/transport_observer.hpp"

namespace lbhttp {

    using ConnectionResult =
        Result<std::shared_ptr<FilterableStreamingHttpConnection>>;

    /**
     * @brief Produces raw connections to a resolved address.
     */
    class ConnectionFactory {
       public:
        virtual ~ConnectionFactory() = default;

        /// @param context Request-scoped context of the caller, may be null.
        /// @param observer May be null; the innermost supplier substitutes a
        /// no-op observer.
        virtual boost::asio::awaitable<ConnectionResult> new_connection(
            tcp::endpoint address, ContextMap const* context,
            std::shared_ptr<TransportObserver> observer) = 0;

        /// @brief Idempotent.
        virtual boost::asio::awaitable<Status> close_async() = 0;

        virtual boost::asio::awaitable<Status> close_async_gracefully() {
            return close_async();
        }
    };

    /**
     * @brief Base for factory filters: forwards to the wrapped factory.
     */
    class DelegatingConnectionFactory : public ConnectionFactory {
       public:
        explicit DelegatingConnectionFactory(
            std::shared_ptr<ConnectionFactory> delegate)
            : delegate_(std::move(delegate)) {}

        boost::asio::awaitable<ConnectionResult> new_connection(
            tcp::endpoint address, ContextMap const* context,
            std::shared_ptr<TransportObserver> observer) override {
            return delegate_->new_connection(address, context,
                                             std::move(observer));
        }

        boost::asio::awaitable<Status> close_async() override {
            return delegate_->close_async();
        }

        boost::asio::awaitable<Status> close_async_gracefully() override {
            return delegate_->close_async_gracefully();
        }

       protected:
        ConnectionFactory& delegate() const { return *delegate_; }

       private:
        std::shared_ptr<ConnectionFactory> delegate_;
    };

    /// @brief Decorates a connection factory.
    using ConnectionFactoryFilter = std::function<std::shared_ptr<
        ConnectionFactory>(std::shared_ptr<ConnectionFactory>)>;

    /// @brief Adapts a filtered connection to the protocol in use.
    using ProtocolBinding = ConnectionFilterFactory;

    struct LBHttpConnectionFactoryOptions {
        HttpConnectionConfiguration config;
        std::vector<ConnectionFactoryFilter> factory_filters;
        /// @brief Applied once, outermost. Optional.
        ConnectionFilterFactory connection_filter;
        /// @brief Optional; identity when empty.
        ProtocolBinding protocol_binding;
    };

    /**
     * @brief Creates load-balanced, concurrency-gated HTTP connections.
     *
     * Pipeline per new_connection():
     *   supplier (raw connect, offloaded if the connect strategy says so)
     *   -> factory filters -> connection filter -> controller
     *   -> protocol binding -> LoadBalancedStreamingHttpConnection
     *
     * Factory filters are listed outermost first. Any failure returns an
     * Error and closes whatever connection was already created; the factory
     * stays usable.
     */
    class LBHttpConnectionFactory {
       public:
        using Options = LBHttpConnectionFactoryOptions;

        /// @throws std::invalid_argument if supplier is null or a factory
        /// filter returns null.
        LBHttpConnectionFactory(HttpExecutionContext exec,
                                ExecutionStrategy connect_strategy,
                                std::shared_ptr<ConnectionFactory> supplier,
                                Options options = {});

        LBHttpConnectionFactory(const LBHttpConnectionFactory&) = delete;
        LBHttpConnectionFactory& operator=(const LBHttpConnectionFactory&) =
            delete;

        using LbConnection = std::shared_ptr<LoadBalancedStreamingHttpConnection>;

        boost::asio::awaitable<Result<LbConnection>> new_connection(
            tcp::endpoint address, ContextMap const* context = nullptr,
            std::shared_ptr<TransportObserver> observer = nullptr);

        boost::asio::awaitable<Status> close_async();
        boost::asio::awaitable<Status> close_async_gracefully();

        HttpExecutionContext const& execution_context() const noexcept {
            return exec_;
        }

        ExecutionStrategy const& connect_strategy() const noexcept {
            return connect_strategy_;
        }

       private:
        class Supplier;

        /// Connection filter, controller and protocol binding over a
        /// connected transport.
        boost::asio::awaitable<Result<LbConnection>> establish(
            std::shared_ptr<FilterableStreamingHttpConnection> filtered,
            tcp::endpoint address);

        HttpExecutionContext exec_;
        ExecutionStrategy connect_strategy_;
        Options options_;
        std::shared_ptr<ConnectionFactory> filterable_;
    };

}  // namespace lbhttp
