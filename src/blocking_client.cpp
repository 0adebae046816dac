#include "lbhttp/blocking_client.hpp"

#include <stdexcept>

#include "lbhttp/logging.hpp"

namespace lbhttp {

    namespace {
        HttpExecutionStrategy resolve(HttpExecutionStrategy s) {
            return s == HttpExecutionStrategy::Default
                       ? DEFAULT_BLOCKING_CONNECTION_STRATEGY
                       : s;
        }

        HttpExecutionContext with_strategy(HttpExecutionContext exec,
                                           HttpExecutionStrategy s) {
            exec.strategy = s;
            return exec;
        }
    }  // namespace

    // ---------------- ReservedBlockingHttpConnection ----------------

    ReservedBlockingHttpConnection::ReservedBlockingHttpConnection(
        std::shared_ptr<ReservedStreamingHttpConnection> connection,
        HttpExecutionStrategy strategy,
        HttpRequestResponseFactory req_res_factory)
        : connection_(std::move(connection)),
          exec_(with_strategy(connection_->execution_context(),
                              resolve(strategy))),
          req_res_factory_(std::move(req_res_factory)) {}

    Status ReservedBlockingHttpConnection::release() {
        auto conn = connection_;
        return detail::blocking_invocation<std::monostate>(
            exec_, [conn]() { return conn->release_async(); });
    }

    Result<HttpResponse> ReservedBlockingHttpConnection::request(
        HttpRequest req) {
        auto conn = connection_;
        auto res = detail::blocking_invocation<StreamingHttpResponse>(
            exec_,
            [conn, sreq = std::move(req).to_streaming()]() mutable {
                return conn->request(std::move(sreq));
            });
        if (!res) return res.forward_error<HttpResponse>();
        return Result<HttpResponse>::ok(to_response(std::move(res).value()));
    }

    Status ReservedBlockingHttpConnection::close() {
        auto conn = connection_;
        return detail::blocking_invocation<std::monostate>(
            exec_, [conn]() { return conn->close_async(); });
    }

    Status ReservedBlockingHttpConnection::close_gracefully() {
        auto conn = connection_;
        return detail::blocking_invocation<std::monostate>(
            exec_, [conn]() { return conn->close_async_gracefully(); });
    }

    // ---------------- BlockingHttpClient ----------------

    namespace {
        std::shared_ptr<StreamingHttpClient> require_client(
            std::shared_ptr<StreamingHttpClient> c) {
            if (!c) {
                throw std::invalid_argument("BlockingHttpClient: null client");
            }
            return c;
        }
    }  // namespace

    BlockingHttpClient::BlockingHttpClient(
        std::shared_ptr<StreamingHttpClient> client,
        HttpExecutionStrategy strategy)
        : client_(require_client(std::move(client))),
          strategy_(resolve(strategy)),
          exec_(with_strategy(client_->execution_context(), strategy_)) {}

    Result<HttpResponse> BlockingHttpClient::request(HttpRequest req) {
        req.meta.context.put_if_absent(HTTP_EXECUTION_STRATEGY_KEY, strategy_);

        auto client = client_;
        auto res = detail::blocking_invocation<StreamingHttpResponse>(
            exec_,
            [client, sreq = std::move(req).to_streaming()]() mutable {
                return client->request(std::move(sreq));
            });
        if (!res) {
            logger()->debug("blocking request failed: {}", res.error().message);
            return res.forward_error<HttpResponse>();
        }
        return Result<HttpResponse>::ok(to_response(std::move(res).value()));
    }

    Result<std::unique_ptr<ReservedBlockingHttpConnection>>
    BlockingHttpClient::reserve_connection(HttpRequestMetaData meta) {
        using R = Result<std::unique_ptr<ReservedBlockingHttpConnection>>;
        meta.context.put_if_absent(HTTP_EXECUTION_STRATEGY_KEY, strategy_);

        auto client = client_;
        auto reserved =
            detail::blocking_invocation<
                std::shared_ptr<ReservedStreamingHttpConnection>>(
                exec_, [client, meta = std::move(meta)]() mutable {
                    return client->reserve_connection(std::move(meta));
                });
        if (!reserved) {
            return reserved.forward_error<
                std::unique_ptr<ReservedBlockingHttpConnection>>();
        }
        return R::ok(std::make_unique<ReservedBlockingHttpConnection>(
            std::move(reserved).value(), strategy_,
            client_->request_response_factory()));
    }

    Status BlockingHttpClient::close() {
        auto client = client_;
        return detail::blocking_invocation<std::monostate>(
            exec_, [client]() { return client->close_async(); });
    }

    Status BlockingHttpClient::close_gracefully() {
        auto client = client_;
        return detail::blocking_invocation<std::monostate>(
            exec_, [client]() { return client->close_async_gracefully(); });
    }

}  // namespace lbhttp
