#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "fake_connection.hpp"
#include "lbhttp/client.hpp"

using namespace lbhttp;
using lbhttp::test::FakeConnectionFactory;
using lbhttp::test::IoThread;

namespace {

    struct ClientFixture : ::testing::Test {
        IoThread io;
        std::shared_ptr<FakeConnectionFactory> supplier;
        std::shared_ptr<SingleAddressStreamingHttpClient> client;

        void make_client(std::size_t max_connections,
                         std::size_t max_concurrency = 1) {
            supplier = std::make_shared<FakeConnectionFactory>(
                io.context(), true, max_concurrency);
            auto factory = std::make_shared<LBHttpConnectionFactory>(
                io.context(), ExecutionStrategy::connect(false), supplier);
            HttpClientConfiguration cfg;
            cfg.max_connections = max_connections;
            client = std::make_shared<SingleAddressStreamingHttpClient>(
                factory, tcp::endpoint{}, cfg);
        }

        Result<StreamingHttpResponse> get(std::string target) {
            return io.run(
                [this, target]()
                    -> boost::asio::awaitable<Result<StreamingHttpResponse>> {
                    StreamingHttpRequest req;
                    req.meta = new_request_meta(http::verb::get, target);
                    co_return co_await client->request(std::move(req));
                });
        }

        Result<std::shared_ptr<ReservedStreamingHttpConnection>> reserve() {
            return io.run(
                [this]() -> boost::asio::awaitable<Result<
                             std::shared_ptr<ReservedStreamingHttpConnection>>> {
                    co_return co_await client->reserve_connection(
                        new_request_meta(http::verb::get, "/"));
                });
        }

        Status close() {
            return io.run([this]() -> boost::asio::awaitable<Status> {
                co_return co_await client->close_async();
            });
        }
    };

}  // namespace

TEST(SingleAddressClientTest, ZeroMaxConnectionsThrows) {
    IoThread io;
    auto supplier = std::make_shared<FakeConnectionFactory>(io.context());
    auto factory = std::make_shared<LBHttpConnectionFactory>(
        io.context(), ExecutionStrategy::connect(false), supplier);
    HttpClientConfiguration cfg;
    cfg.max_connections = 0;
    EXPECT_THROW(
        SingleAddressStreamingHttpClient(factory, tcp::endpoint{}, cfg),
        std::invalid_argument);
}

TEST_F(ClientFixture, OpensConnectionLazilyAndReusesIt) {
    make_client(2);
    EXPECT_EQ(client->connection_count(), 0u);

    auto r1 = get("/a");
    ASSERT_TRUE(r1);
    EXPECT_EQ(r1.value().payload.front(), "/a");
    ASSERT_TRUE(get("/b"));

    // The permit is returned after each exchange, so one connection serves
    // sequential requests.
    EXPECT_EQ(client->connection_count(), 1u);
    EXPECT_EQ(supplier->created.front()->requests.load(), 2);
}

TEST_F(ClientFixture, ReservationExcludesRequestsUntilReleased) {
    make_client(1);
    auto reserved = reserve();
    ASSERT_TRUE(reserved);

    auto rejected = get("/x");
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, Error::Code::Rejected);

    auto conn = reserved.value();
    auto st = io.run([conn]() -> boost::asio::awaitable<Status> {
        co_return co_await conn->release_async();
    });
    ASSERT_TRUE(st);
    EXPECT_TRUE(get("/x"));

    // The released handle no longer bypasses the controller.
    auto stale = io.run(
        [conn]() -> boost::asio::awaitable<Result<StreamingHttpResponse>> {
            StreamingHttpRequest req;
            req.meta = new_request_meta(http::verb::get, "/stale");
            co_return co_await conn->request(std::move(req));
        });
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, Error::Code::Rejected);
    EXPECT_EQ(supplier->created.front()->requests.load(), 1);
}

TEST_F(ClientFixture, SecondReservationOpensSecondConnection) {
    make_client(2);
    auto r1 = reserve();
    auto r2 = reserve();
    ASSERT_TRUE(r1);
    ASSERT_TRUE(r2);
    EXPECT_EQ(client->connection_count(), 2u);

    auto r3 = reserve();
    ASSERT_FALSE(r3);
    EXPECT_EQ(r3.error().code, Error::Code::Rejected);
}

TEST_F(ClientFixture, ClosingConnectionIsReplaced) {
    make_client(1);
    ASSERT_TRUE(get("/a"));
    supplier->created.front()->fire_closing();

    ASSERT_TRUE(get("/b"));
    EXPECT_EQ(supplier->created.size(), 2u);
    EXPECT_EQ(client->connection_count(), 1u);
}

TEST_F(ClientFixture, ConnectFailureIsReported) {
    make_client(1);
    supplier->fail_next = true;
    auto r = get("/a");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
    EXPECT_TRUE(get("/a"));
}

TEST_F(ClientFixture, CloseIsIdempotentAndFinal) {
    make_client(1);
    ASSERT_TRUE(get("/a"));

    EXPECT_TRUE(close());
    EXPECT_TRUE(close());
    EXPECT_EQ(supplier->close_calls, 1);
    EXPECT_EQ(supplier->created.front()->close_calls.load(), 1);

    auto r = get("/a");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, Error::Code::ConnectionClosed);
}
