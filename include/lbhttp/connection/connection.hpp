#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <memory>
#include <utility>

#include "lbhttp/event_stream.hpp"
#include "lbhttp/execution_strategy.hpp"
#include "lbhttp/request.hpp"
#include "lbhttp/response.hpp"
#include "lbhttp/result.hpp"

namespace lbhttp {

    using tcp = boost::asio::ip::tcp;

    /**
     * @brief Transport-level facts about a connection.
     */
    class ConnectionContext {
       public:
        virtual ~ConnectionContext() = default;

        virtual tcp::endpoint local_address() const = 0;
        virtual tcp::endpoint remote_address() const = 0;

        /// @brief HTTP version spoken on this connection, 11 for HTTP/1.1.
        virtual unsigned protocol_version() const { return 11; }

        virtual bool secure() const { return false; }

        /// @brief Optional capability: a notifier that fires when the
        /// connection *starts* closing, before on_close().
        /// @return nullptr if the transport has no such signal.
        virtual CloseNotifier* closing() { return nullptr; }
    };

    /**
     * @brief A streaming HTTP connection that filters can decorate.
     *
     * request() may be called concurrently; the implementation orders the
     * exchanges on the wire.
     */
    class FilterableStreamingHttpConnection {
       public:
        virtual ~FilterableStreamingHttpConnection() = default;

        virtual boost::asio::awaitable<Result<StreamingHttpResponse>> request(
            StreamingHttpRequest req) = 0;

        virtual ConnectionContext& connection_context() = 0;
        virtual TransportEventRegistry& transport_events() = 0;
        virtual HttpExecutionContext const& execution_context() const = 0;

        /// @brief Fires once the connection is fully closed.
        virtual CloseNotifier& on_close() = 0;

        /// @brief Close now. Idempotent.
        virtual boost::asio::awaitable<Status> close_async() = 0;

        /// @brief Close after in-flight exchanges finish. Idempotent.
        virtual boost::asio::awaitable<Status> close_async_gracefully() = 0;
    };

    /**
     * @brief A connection reserved for exclusive use by one caller.
     */
    class ReservedStreamingHttpConnection
        : public FilterableStreamingHttpConnection {
       public:
        /// @brief Give the reservation back; the connection stays open.
        virtual boost::asio::awaitable<Status> release_async() = 0;
    };

    /**
     * @brief Base for connection filters: forwards everything to the
     * wrapped connection. Override what the filter changes.
     */
    class StreamingHttpConnectionFilter
        : public FilterableStreamingHttpConnection {
       public:
        explicit StreamingHttpConnectionFilter(
            std::shared_ptr<FilterableStreamingHttpConnection> delegate)
            : delegate_(std::move(delegate)) {}

        boost::asio::awaitable<Result<StreamingHttpResponse>> request(
            StreamingHttpRequest req) override {
            return delegate_->request(std::move(req));
        }

        ConnectionContext& connection_context() override {
            return delegate_->connection_context();
        }

        TransportEventRegistry& transport_events() override {
            return delegate_->transport_events();
        }

        HttpExecutionContext const& execution_context() const override {
            return delegate_->execution_context();
        }

        CloseNotifier& on_close() override { return delegate_->on_close(); }

        boost::asio::awaitable<Status> close_async() override {
            return delegate_->close_async();
        }

        boost::asio::awaitable<Status> close_async_gracefully() override {
            return delegate_->close_async_gracefully();
        }

       protected:
        FilterableStreamingHttpConnection& delegate() const {
            return *delegate_;
        }

       private:
        std::shared_ptr<FilterableStreamingHttpConnection> delegate_;
    };

    /// @brief Decorates a freshly created connection. An error result makes
    /// the connection attempt fail.
    using ConnectionFilterFactory =
        std::function<Result<std::shared_ptr<FilterableStreamingHttpConnection>>(
            std::shared_ptr<FilterableStreamingHttpConnection>)>;

}  // namespace lbhttp
