#include "lbhttp/connection/load_balanced_connection.hpp"

#include <stdexcept>
#include <utility>

namespace lbhttp {

    namespace {
        std::shared_ptr<FilterableStreamingHttpConnection> require_connection(
            std::shared_ptr<FilterableStreamingHttpConnection> c) {
            if (!c) {
                throw std::invalid_argument(
                    "LoadBalancedStreamingHttpConnection: null connection");
            }
            return c;
        }
    }  // namespace

    LoadBalancedStreamingHttpConnection::LoadBalancedStreamingHttpConnection(
        std::shared_ptr<FilterableStreamingHttpConnection> bound,
        std::shared_ptr<Controller> controller,
        HttpExecutionStrategy strategy)
        : StreamingHttpConnectionFilter(require_connection(std::move(bound))),
          controller_(std::move(controller)),
          exec_(delegate().execution_context()) {
        if (!controller_) {
            throw std::invalid_argument(
                "LoadBalancedStreamingHttpConnection: null controller");
        }
        exec_.strategy = strategy;
    }

    boost::asio::awaitable<Status> ReservedLoadBalancedConnection::release_async() {
        drop_reservation();
        co_return ok_status();
    }

    boost::asio::awaitable<Status> ReservedLoadBalancedConnection::close_async() {
        drop_reservation();
        co_return co_await conn_->close_async();
    }

    boost::asio::awaitable<Status>
    ReservedLoadBalancedConnection::close_async_gracefully() {
        drop_reservation();
        co_return co_await conn_->close_async_gracefully();
    }

}  // namespace lbhttp
