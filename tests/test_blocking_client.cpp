#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "fake_connection.hpp"
#include "lbhttp/blocking_client.hpp"

using namespace lbhttp;
using lbhttp::test::FakeConnectionFactory;
using lbhttp::test::IoThread;

namespace {

    /// Async client double: records the strategy marker it sees and fails
    /// on demand.
    class RecordingClient final : public StreamingHttpClient {
       public:
        explicit RecordingClient(HttpExecutionContext exec)
            : exec_(std::move(exec)), factory_("recording") {}

        boost::asio::awaitable<Result<StreamingHttpResponse>> request(
            StreamingHttpRequest req) override {
            if (auto const* s = req.meta.context.get(HTTP_EXECUTION_STRATEGY_KEY)) {
                seen_strategy = *s;
            }
            seen_body.clear();
            for (auto const& c : req.payload) seen_body += c;
            if (fail) {
                co_return Result<StreamingHttpResponse>::err(*fail);
            }
            StreamingHttpResponse res;
            res.header.result(http::status::accepted);
            res.payload = {"he", "llo"};
            co_return Result<StreamingHttpResponse>::ok(std::move(res));
        }

        boost::asio::awaitable<
            Result<std::shared_ptr<ReservedStreamingHttpConnection>>>
        reserve_connection(HttpRequestMetaData meta) override {
            if (auto const* s = meta.context.get(HTTP_EXECUTION_STRATEGY_KEY)) {
                seen_strategy = *s;
            }
            co_return Result<std::shared_ptr<ReservedStreamingHttpConnection>>::
                err(Error::Code::Rejected, "no reservation");
        }

        HttpExecutionContext const& execution_context() const override {
            return exec_;
        }

        HttpRequestResponseFactory const& request_response_factory()
            const override {
            return factory_;
        }

        boost::asio::awaitable<Status> close_async() override {
            ++closes;
            co_return ok_status();
        }

        boost::asio::awaitable<Status> close_async_gracefully() override {
            ++graceful_closes;
            co_return ok_status();
        }

        std::optional<Error> fail;
        std::optional<HttpExecutionStrategy> seen_strategy;
        std::string seen_body;
        int closes{0};
        int graceful_closes{0};

       private:
        HttpExecutionContext exec_;
        HttpRequestResponseFactory factory_;
    };

}  // namespace

TEST(BlockingHttpClientTest, NullClientThrows) {
    EXPECT_THROW(BlockingHttpClient(nullptr), std::invalid_argument);
}

TEST(BlockingHttpClientTest, DefaultStrategyResolvesToBlockingDefault) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async);
    EXPECT_EQ(client.strategy(), DEFAULT_BLOCKING_CONNECTION_STRATEGY);
    EXPECT_EQ(client.execution_context().strategy,
              DEFAULT_BLOCKING_CONNECTION_STRATEGY);

    BlockingHttpClient explicit_client(async,
                                       HttpExecutionStrategy::OffloadAll);
    EXPECT_EQ(explicit_client.strategy(), HttpExecutionStrategy::OffloadAll);
}

TEST(BlockingHttpClientTest, RequestAggregatesResponse) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async);

    auto req = client.new_request(http::verb::post, "/echo");
    req.payload = "ping";
    auto res = client.request(std::move(req));
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().status_code, 202);
    EXPECT_EQ(res.value().body, "hello");
    EXPECT_EQ(async->seen_body, "ping");
}

TEST(BlockingHttpClientTest, AddsStrategyMarkerWhenAbsent) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async, HttpExecutionStrategy::OffloadReceive);

    ASSERT_TRUE(client.request(client.new_request(http::verb::get, "/")));
    EXPECT_EQ(async->seen_strategy, HttpExecutionStrategy::OffloadReceive);
}

TEST(BlockingHttpClientTest, KeepsCallerStrategyMarker) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async);

    auto req = client.new_request(http::verb::get, "/");
    req.meta.context.put(HTTP_EXECUTION_STRATEGY_KEY,
                         HttpExecutionStrategy::OffloadNone);
    ASSERT_TRUE(client.request(std::move(req)));
    EXPECT_EQ(async->seen_strategy, HttpExecutionStrategy::OffloadNone);
}

TEST(BlockingHttpClientTest, AsyncErrorIsReturnedUnchanged) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    async->fail = Error{Error::Code::Timeout, "took too long"};
    BlockingHttpClient client(async);

    auto res = client.request(client.new_request(http::verb::get, "/"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, Error::Code::Timeout);
    EXPECT_EQ(res.error().message, "took too long");
}

TEST(BlockingHttpClientTest, ReserveErrorIsReturnedAndMarked) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async);

    auto r = client.reserve_connection(new_request_meta(http::verb::get, "/"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, Error::Code::Rejected);
    EXPECT_EQ(async->seen_strategy, DEFAULT_BLOCKING_CONNECTION_STRATEGY);
}

TEST(BlockingHttpClientTest, CallOnIoThreadFailsInsteadOfDeadlocking) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async);

    auto code = io.run([&]() -> boost::asio::awaitable<Error::Code> {
        auto res = client.request(client.new_request(http::verb::get, "/"));
        co_return res ? Error::Code::Unknown : res.error().code;
    });
    EXPECT_EQ(code, Error::Code::WouldBlockIoThread);
}

TEST(BlockingHttpClientTest, CloseDelegates) {
    IoThread io;
    auto async = std::make_shared<RecordingClient>(io.context());
    BlockingHttpClient client(async);
    EXPECT_TRUE(client.close());
    EXPECT_TRUE(client.close_gracefully());
    EXPECT_EQ(async->closes, 1);
    EXPECT_EQ(async->graceful_closes, 1);
}

TEST(BlockingHttpClientTest, ReservedConnectionOverLoadBalancedClient) {
    IoThread io;
    auto supplier = std::make_shared<FakeConnectionFactory>(io.context());
    auto factory = std::make_shared<LBHttpConnectionFactory>(
        io.context(), ExecutionStrategy::connect(false), supplier);
    auto async = std::make_shared<SingleAddressStreamingHttpClient>(
        factory, tcp::endpoint{}, HttpClientConfiguration{});
    BlockingHttpClient client(async);

    auto reserved =
        client.reserve_connection(new_request_meta(http::verb::get, "/"));
    ASSERT_TRUE(reserved);
    auto& conn = *reserved.value();
    EXPECT_EQ(conn.execution_context().strategy,
              DEFAULT_BLOCKING_CONNECTION_STRATEGY);

    auto res = conn.request(conn.new_request(http::verb::get, "/reserved"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().body, "/reserved");

    auto it = conn.transport_event_iterable(MAX_CONCURRENCY);
    EXPECT_EQ(it.next_for(std::chrono::milliseconds(100)), std::size_t{1});

    EXPECT_TRUE(conn.release());
    EXPECT_TRUE(client.close());
}

TEST(BlockingEventIteratorTest, DeliversValuesThenEnds) {
    EventStream<int> stream;
    BlockingEventIterator<int> it(stream);

    std::thread producer([&] {
        stream.emit(5);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stream.complete();
    });

    EXPECT_EQ(it.next(), 5);
    producer.join();
    EXPECT_EQ(it.next(), std::nullopt);
    EXPECT_TRUE(it.done());
}

TEST(BlockingEventIteratorTest, CloseUnblocksAndIsIdempotent) {
    EventStream<int> stream;
    BlockingEventIterator<int> it(stream);

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        it.close();
    });
    EXPECT_EQ(it.next(), std::nullopt);
    closer.join();

    it.close();
    stream.emit(1);
    EXPECT_FALSE(it.has_pending());
}

TEST(BlockingEventIteratorTest, NextForTimesOut) {
    EventStream<int> stream;
    BlockingEventIterator<int> it(stream);
    EXPECT_EQ(it.next_for(std::chrono::milliseconds(10)), std::nullopt);
    EXPECT_FALSE(it.done());
}
