#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "lbhttp/codec/framing_queues.hpp"
#include "lbhttp/codec/request_encoder.hpp"
#include "lbhttp/config.hpp"
#include "lbhttp/connection/connection.hpp"
#include "lbhttp/connection/connection_factory.hpp"
#include "lbhttp/connection/turnstile.hpp"
#include "lbhttp/logging.hpp"
#include "lbhttp/transport_observer.hpp"

namespace lbhttp {

    using HttpStream = boost::beast::tcp_stream;
    using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    /**
     * HTTP/1.1 connection over a Beast stream.
     *
     * Owns the RequestEncoder and the decoder side of its FramingQueues.
     * Requests may be pipelined: heads are written in ticket order through
     * the write turnstile, responses are read in the same order through the
     * read turnstile. A request with Expect: 100-continue keeps the write
     * turn until its body is sent (100 Continue) or cancelled (final
     * response first).
     *
     * SAFETY:
     * - Public methods may be called from any thread.
     * - Everything touching the stream, encoder or queues runs on one
     *   strand of the I/O executor.
     *
     * LIFECYCLE:
     * 1. Created connected by a supplier, then start()
     * 2. start() emits MAX_CONCURRENCY = max_pipelined_requests
     * 3. close: closing notifier -> socket closed -> event streams
     *    complete -> on_close()
     */
    template <typename Stream>
    class AsioStreamingHttpConnection final
        : public FilterableStreamingHttpConnection,
          public std::enable_shared_from_this<
              AsioStreamingHttpConnection<Stream>> {
        using Strand =
            boost::asio::strand<boost::asio::io_context::executor_type>;
        using ResponseResult = Result<StreamingHttpResponse>;

       public:
        AsioStreamingHttpConnection(Stream stream, HttpExecutionContext exec,
                                    HttpConnectionConfiguration cfg,
                                    std::shared_ptr<TransportObserver> observer,
                                    bool secure)
            : stream_(std::move(stream)),
              exec_(std::move(exec)),
              strand_(boost::asio::make_strand(exec_.io_executor)),
              cfg_(std::move(cfg)),
              observer_(as_safe_observer(std::move(observer))),
              queues_(std::make_shared<FramingQueues>(
                  cfg_.signal_queue_capacity)),
              encoder_(queues_,
                       [](ConnectionEvent const& e) {
                           logger()->trace(
                               "encoder event: {}",
                               std::holds_alternative<ContinueEvent>(e)
                                   ? "continue"
                                   : "cancel-write");
                       }),
              writes_(strand_),
              reads_(strand_),
              drained_(strand_) {
            boost::system::error_code ec;
            auto& sock = boost::beast::get_lowest_layer(stream_).socket();
            context_.local = sock.local_endpoint(ec);
            context_.remote = sock.remote_endpoint(ec);
            context_.is_secure = secure;
            drained_.expires_at(std::chrono::steady_clock::time_point::max());
        }

        AsioStreamingHttpConnection(const AsioStreamingHttpConnection&) =
            delete;
        AsioStreamingHttpConnection& operator=(
            const AsioStreamingHttpConnection&) = delete;

        ~AsioStreamingHttpConnection() noexcept {
            boost::system::error_code ec;
            auto& sock = boost::beast::get_lowest_layer(stream_).socket();
            if (sock.is_open()) {
                sock.shutdown(tcp::socket::shutdown_both, ec);
                sock.close(ec);
            }
        }

        /// @brief Publish the initial max-concurrency. Call once, after
        /// the transport is connected.
        void start() {
            events_.stream(MAX_CONCURRENCY).emit(cfg_.max_pipelined_requests);
            observer_->on_connection_established();
        }

        boost::asio::awaitable<ResponseResult> request(
            StreamingHttpRequest req) override {
            auto self = this->shared_from_this();
            co_return co_await boost::asio::co_spawn(
                strand_,
                [self, req = std::move(req)]() mutable
                -> boost::asio::awaitable<ResponseResult> {
                    co_return co_await self->exchange(std::move(req));
                },
                boost::asio::use_awaitable);
        }

        ConnectionContext& connection_context() override { return context_; }
        TransportEventRegistry& transport_events() override { return events_; }
        HttpExecutionContext const& execution_context() const override {
            return exec_;
        }
        CloseNotifier& on_close() override { return closed_notifier_; }

        boost::asio::awaitable<Status> close_async() override {
            auto self = this->shared_from_this();
            co_await boost::asio::co_spawn(
                strand_,
                [self]() -> boost::asio::awaitable<void> {
                    self->do_close(std::nullopt);
                    co_return;
                },
                boost::asio::use_awaitable);
            co_return ok_status();
        }

        boost::asio::awaitable<Status> close_async_gracefully() override {
            auto self = this->shared_from_this();
            co_await boost::asio::co_spawn(
                strand_,
                [self]() -> boost::asio::awaitable<void> {
                    self->begin_closing();
                    while (self->inflight_ > 0 && !self->closed_) {
                        boost::system::error_code ec;
                        co_await self->drained_.async_wait(
                            boost::asio::redirect_error(
                                boost::asio::use_awaitable, ec));
                    }
                    self->do_close(std::nullopt);
                },
                boost::asio::use_awaitable);
            co_return ok_status();
        }

        /// @brief For tests: the queues shared by encoder and decoder.
        FramingQueues const& framing_queues() const noexcept {
            return *queues_;
        }

       private:
        class Context final : public ConnectionContext {
           public:
            tcp::endpoint local_address() const override { return local; }
            tcp::endpoint remote_address() const override { return remote; }
            bool secure() const override { return is_secure; }
            CloseNotifier* closing() override { return &closing_notifier; }

            tcp::endpoint local;
            tcp::endpoint remote;
            bool is_secure{false};
            CloseNotifier closing_notifier;
        };

        /// State of one request while it is on the wire.
        struct Exchange {
            StreamingHttpRequest req;
            bool holding_write{false};
            bool body_declared{false};
        };

        boost::asio::awaitable<ResponseResult> exchange(
            StreamingHttpRequest req) {
            if (closing_) {
                co_return ResponseResult::err(Error::Code::ConnectionClosed,
                                              "connection is closing");
            }
            if (!cfg_.user_agent.empty() &&
                req.meta.header.find(http::field::user_agent) ==
                    req.meta.header.end()) {
                req.meta.header.set(http::field::user_agent, cfg_.user_agent);
            }

            ++inflight_;
            Exchange ex{std::move(req)};
            std::uint64_t const ticket = next_ticket_++;

            co_await writes_.wait_turn(ticket);
            ex.holding_write = true;
            Status st = Status::err(Error::Code::ConnectionClosed,
                                    "connection closed");
            // Nothing more may follow a response that ended the write side.
            if (!closed_ && !writes_stopped_) st = co_await write_head(ex);
            bool const deferred = st && encoder_.expect_continue();
            if (st && !deferred) st = co_await write_body(ex);
            if (!deferred) release_write(ex);

            co_await reads_.wait_turn(ticket);
            ResponseResult res = ResponseResult::err(Error::Code::Unknown, "");
            if (!st) {
                res = ResponseResult::err(st.error());
            } else if (closed_) {
                res = ResponseResult::err(Error::Code::ConnectionClosed,
                                          "connection closed");
            } else {
                res = co_await read_response(ex);
            }
            reads_.advance();
            release_write(ex);

            // A bad request that never reached the wire leaves the
            // connection usable; everything else breaks framing.
            if (!res && res.error().code != Error::Code::InvalidRequest &&
                res.error().code != Error::Code::ConnectionClosed) {
                do_close(res.error());
            }
            finish_exchange();
            co_return res;
        }

        boost::asio::awaitable<Status> write_head(Exchange& ex) {
            auto st = encoder_.encode_meta(ex.req.meta, wbuf_);
            if (!st) {
                wbuf_.clear();
                co_return st;
            }
            ex.body_declared =
                encoder_.state() == RequestEncoder::State::Chunked ||
                encoder_.remaining_content_length().value_or(0) > 0;
            co_return co_await flush();
        }

        boost::asio::awaitable<Status> write_body(Exchange& ex) {
            for (auto const& chunk : ex.req.payload) {
                auto st = encoder_.encode_payload(chunk, wbuf_);
                if (!st) co_return st;
            }
            auto st = encoder_.encode_end(
                ex.req.trailers ? &*ex.req.trailers : nullptr, wbuf_);
            if (!st) co_return st;
            co_return co_await flush();
        }

        boost::asio::awaitable<Status> flush() {
            boost::system::error_code ec;
            arm_timeout();
            auto n = co_await boost::asio::async_write(
                stream_, wbuf_.data(),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            wbuf_.consume(n);
            if (ec) co_return Status::err(io_error(Error::Code::SendFailed, ec));
            co_return ok_status();
        }

        boost::asio::awaitable<ResponseResult> read_response(Exchange& ex) {
            auto method = queues_->methods.poll();
            auto signal = queues_->signals.poll();
            if (!method || !signal) {
                co_return ResponseResult::err(
                    Error::Code::ReceiveFailed,
                    "response without a matching request");
            }
            bool awaiting_continue =
                *signal == Signal::RequestWithExpectContinue &&
                ex.holding_write;

            for (;;) {
                http::response_parser<http::string_body> parser;
                parser.body_limit(cfg_.max_response_body_bytes);
                if (method->verb() == http::verb::head) parser.skip(true);

                boost::system::error_code ec;
                arm_timeout();
                co_await http::async_read_header(
                    stream_, rbuf_, parser,
                    boost::asio::redirect_error(boost::asio::use_awaitable,
                                                ec));
                if (ec) {
                    co_return ResponseResult::err(
                        io_error(Error::Code::ReceiveFailed, ec));
                }

                unsigned const status = parser.get().result_int();
                if (status / 100 == 1 && status != 101) {
                    if (status == 100 && awaiting_continue) {
                        encoder_.on_event(ContinueEvent{});
                        awaiting_continue = false;
                        auto st = co_await write_body(ex);
                        release_write(ex);
                        if (!st) co_return ResponseResult::err(st.error());
                    }
                    // Interim response; the final one follows.
                    continue;
                }

                if (awaiting_continue) {
                    encoder_.on_event(CancelWriteEvent{});
                    awaiting_continue = false;
                    // The peer may still expect the body we never sent, so
                    // queued requests must not reach the wire.
                    if (ex.body_declared) {
                        writes_stopped_ = true;
                        begin_closing();
                    }
                    release_write(ex);
                }

                if (!parser.is_done() &&
                    !response_body_forbidden(method->verb(), status)) {
                    co_await http::async_read(
                        stream_, rbuf_, parser,
                        boost::asio::redirect_error(boost::asio::use_awaitable,
                                                    ec));
                    if (ec) {
                        co_return ResponseResult::err(
                            io_error(Error::Code::ReceiveFailed, ec));
                    }
                }

                auto msg = parser.release();
                if (!msg.keep_alive() ||
                    (method->verb() == http::verb::connect &&
                     status / 100 == 2)) {
                    writes_stopped_ = true;
                    begin_closing();
                }
                co_return ResponseResult::ok(
                    from_beast_response(std::move(msg)));
            }
        }

        void release_write(Exchange& ex) {
            if (!ex.holding_write) return;
            ex.holding_write = false;
            writes_.advance();
        }

        void arm_timeout() {
            boost::beast::get_lowest_layer(stream_).expires_after(
                cfg_.request_timeout);
        }

        void finish_exchange() {
            --inflight_;
            if (inflight_ == 0) {
                drained_.cancel();
                if (closing_) do_close(std::nullopt);
            }
        }

        /// Stop taking requests; in-flight exchanges finish.
        void begin_closing() {
            if (closing_) return;
            closing_ = true;
            context_.closing_notifier.notify();
        }

        void do_close(std::optional<Error> cause) {
            if (closed_) return;
            begin_closing();
            closed_ = true;

            boost::system::error_code ec;
            auto& sock = boost::beast::get_lowest_layer(stream_).socket();
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
            queues_->methods.clear();
            queues_->signals.clear();

            if (cause) {
                logger()->debug("connection closed: {} ({})",
                                cause->message, to_string(cause->code));
            } else {
                logger()->debug("connection closed");
            }
            events_.complete_all();
            closed_notifier_.notify();
            observer_->on_connection_closed(cause);
            drained_.cancel();
        }

        static Error io_error(Error::Code code,
                              boost::system::error_code const& ec) {
            if (ec == boost::beast::error::timeout) {
                return Error{Error::Code::Timeout, ec.message()};
            }
            return Error{code, ec.message()};
        }

        Stream stream_;
        HttpExecutionContext exec_;
        Strand strand_;
        HttpConnectionConfiguration cfg_;
        std::shared_ptr<TransportObserver> observer_;

        std::shared_ptr<FramingQueues> queues_;
        RequestEncoder encoder_;

        Turnstile writes_;
        Turnstile reads_;
        boost::asio::steady_timer drained_;

        boost::beast::flat_buffer wbuf_;
        boost::beast::flat_buffer rbuf_;

        Context context_;
        TransportEventRegistry events_;
        CloseNotifier closed_notifier_;

        std::uint64_t next_ticket_{0};
        std::size_t inflight_{0};
        bool closing_{false};
        bool writes_stopped_{false};
        bool closed_{false};
    };

    /**
     * @brief Raw plain-TCP connection supplier.
     */
    class TcpConnectionFactory final : public ConnectionFactory {
       public:
        TcpConnectionFactory(HttpExecutionContext exec,
                             HttpConnectionConfiguration cfg);

        boost::asio::awaitable<ConnectionResult> new_connection(
            tcp::endpoint address, ContextMap const* context,
            std::shared_ptr<TransportObserver> observer) override;

        boost::asio::awaitable<Status> close_async() override;

       private:
        HttpExecutionContext exec_;
        HttpConnectionConfiguration cfg_;
        std::atomic<bool> closed_{false};
    };

    /**
     * @brief Raw TLS connection supplier.
     *
     * @note Certificate policy lives in the ssl::context; only SNI is set
     * here.
     */
    class TlsConnectionFactory final : public ConnectionFactory {
       public:
        TlsConnectionFactory(HttpExecutionContext exec,
                             HttpConnectionConfiguration cfg,
                             boost::asio::ssl::context& ssl_ctx,
                             std::string server_name);

        boost::asio::awaitable<ConnectionResult> new_connection(
            tcp::endpoint address, ContextMap const* context,
            std::shared_ptr<TransportObserver> observer) override;

        boost::asio::awaitable<Status> close_async() override;

       private:
        HttpExecutionContext exec_;
        HttpConnectionConfiguration cfg_;
        boost::asio::ssl::context& ssl_ctx_;
        std::string server_name_;
        std::atomic<bool> closed_{false};
    };

}  // namespace lbhttp
