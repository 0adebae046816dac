#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "lbhttp/client.hpp"
#include "lbhttp/connection/connection.hpp"
#include "lbhttp/event_stream.hpp"
#include "lbhttp/execution_strategy.hpp"
#include "lbhttp/request.hpp"
#include "lbhttp/response.hpp"
#include "lbhttp/result.hpp"

namespace lbhttp {

    /**
     * @brief Pull-based, blocking view of an EventStream.
     *
     * Holds at most one pending value: a value emitted while the previous
     * one was not yet taken replaces it. close() (or destruction)
     * unsubscribes and wakes a blocked next().
     *
     * @note Never call next() on the I/O thread that emits the values.
     */
    template <typename T>
    class BlockingEventIterator {
       public:
        explicit BlockingEventIterator(EventStream<T>& stream)
            : state_(std::make_shared<State>()) {
            std::weak_ptr<State> weak = state_;
            sub_ = stream.subscribe(
                [weak](T const& v) {
                    if (auto st = weak.lock()) {
                        {
                            std::lock_guard<std::mutex> lk(st->mu);
                            st->pending = v;
                        }
                        st->cv.notify_all();
                    }
                },
                [weak] {
                    if (auto st = weak.lock()) {
                        {
                            std::lock_guard<std::mutex> lk(st->mu);
                            st->completed = true;
                        }
                        st->cv.notify_all();
                    }
                });
        }

        BlockingEventIterator(BlockingEventIterator&&) noexcept = default;
        BlockingEventIterator& operator=(BlockingEventIterator&&) noexcept =
            default;

        ~BlockingEventIterator() { close(); }

        /// @brief Block until a value is available or the stream ends.
        /// @return nullopt once the stream completed or the iterator was
        /// closed and nothing is pending.
        std::optional<T> next() {
            std::unique_lock<std::mutex> lk(state_->mu);
            state_->cv.wait(lk, [&] { return ready_locked(); });
            return take_locked();
        }

        /// @brief Like next(), giving up after timeout.
        std::optional<T> next_for(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lk(state_->mu);
            state_->cv.wait_for(lk, timeout, [&] { return ready_locked(); });
            return take_locked();
        }

        /// @brief True if next() would return a value without blocking.
        bool has_pending() const {
            std::lock_guard<std::mutex> lk(state_->mu);
            return state_->pending.has_value();
        }

        /// @brief True once the stream completed or close() was called.
        bool done() const {
            std::lock_guard<std::mutex> lk(state_->mu);
            return state_->completed || state_->closed;
        }

        /// @brief Unsubscribe. Idempotent.
        void close() {
            if (!state_) return;  // moved-from
            sub_.disconnect();
            {
                std::lock_guard<std::mutex> lk(state_->mu);
                state_->closed = true;
            }
            state_->cv.notify_all();
        }

       private:
        struct State {
            mutable std::mutex mu;
            std::condition_variable cv;
            std::optional<T> pending;
            bool completed{false};
            bool closed{false};
        };

        bool ready_locked() const {
            return state_->pending.has_value() || state_->completed ||
                   state_->closed;
        }

        std::optional<T> take_locked() {
            std::optional<T> out = std::move(state_->pending);
            state_->pending.reset();
            return out;
        }

        std::shared_ptr<State> state_;
        Subscription sub_;
    };

    namespace detail {
        /// Run one asynchronous operation on the I/O executor and block the
        /// calling thread until it finishes. Exceptions thrown by the
        /// coroutine are rethrown here.
        template <typename T, typename F>
        Result<T> blocking_invocation(HttpExecutionContext const& exec,
                                      F&& op) {
            if (exec.in_io_thread()) {
                return Result<T>::err(Error::Code::WouldBlockIoThread,
                                      "blocking call on the I/O thread");
            }
            std::future<Result<T>> fut = boost::asio::co_spawn(
                exec.io_executor, std::forward<F>(op),
                boost::asio::use_future);
            return fut.get();
        }
    }  // namespace detail

    /**
     * @brief A reserved connection with a blocking, aggregated surface.
     */
    class ReservedBlockingHttpConnection {
       public:
        /// @param strategy Default is resolved to
        /// DEFAULT_BLOCKING_CONNECTION_STRATEGY.
        ReservedBlockingHttpConnection(
            std::shared_ptr<ReservedStreamingHttpConnection> connection,
            HttpExecutionStrategy strategy,
            HttpRequestResponseFactory req_res_factory);

        /// @brief Give the reservation back.
        Status release();

        Result<HttpResponse> request(HttpRequest req);

        template <typename T>
        BlockingEventIterator<T> transport_event_iterable(
            HttpEventKey<T> const& key) {
            return BlockingEventIterator<T>(
                connection_->transport_events().stream(key));
        }

        Status close();
        Status close_gracefully();

        HttpRequest new_request(HttpRequestMethod const& method,
                                std::string_view target) const {
            return req_res_factory_.new_request(method, target);
        }

        HttpRequestResponseFactory const& http_response_factory() const {
            return req_res_factory_;
        }

        ConnectionContext& connection_context() {
            return connection_->connection_context();
        }

        /// @brief The connection's execution context, carrying the
        /// resolved strategy.
        HttpExecutionContext const& execution_context() const {
            return exec_;
        }

        ReservedStreamingHttpConnection& as_streaming_connection() {
            return *connection_;
        }

       private:
        std::shared_ptr<ReservedStreamingHttpConnection> connection_;
        HttpExecutionContext exec_;
        HttpRequestResponseFactory req_res_factory_;
    };

    /**
     * @brief Blocking client over a StreamingHttpClient.
     *
     * Each call runs exactly one asynchronous operation and blocks until it
     * completes. Errors come back as the Error of the asynchronous path;
     * calls from the I/O thread fail with WouldBlockIoThread.
     */
    class BlockingHttpClient {
       public:
        /// @param strategy Default is resolved to
        /// DEFAULT_BLOCKING_CONNECTION_STRATEGY.
        /// @throws std::invalid_argument on a null client.
        explicit BlockingHttpClient(
            std::shared_ptr<StreamingHttpClient> client,
            HttpExecutionStrategy strategy = HttpExecutionStrategy::Default);

        /// @brief Send req and wait for the whole response. The
        /// execution-strategy marker is added to req's context unless it is
        /// already there.
        Result<HttpResponse> request(HttpRequest req);

        Result<std::unique_ptr<ReservedBlockingHttpConnection>>
        reserve_connection(HttpRequestMetaData meta);

        /// @brief Idempotent.
        Status close();
        Status close_gracefully();

        HttpRequest new_request(HttpRequestMethod const& method,
                                std::string_view target) const {
            return client_->request_response_factory().new_request(method,
                                                                   target);
        }

        HttpRequestResponseFactory const& http_response_factory() const {
            return client_->request_response_factory();
        }

        HttpExecutionStrategy strategy() const noexcept { return strategy_; }

        HttpExecutionContext const& execution_context() const {
            return exec_;
        }

        StreamingHttpClient& as_streaming_client() { return *client_; }

       private:
        std::shared_ptr<StreamingHttpClient> client_;
        HttpExecutionStrategy strategy_;
        HttpExecutionContext exec_;
    };

}  // namespace lbhttp
