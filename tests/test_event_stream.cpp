#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

#include "lbhttp/codec/framing_queues.hpp"
#include "lbhttp/event_stream.hpp"
#include "lbhttp/logging.hpp"

using namespace lbhttp;

TEST(EventStreamTest, ReplaysLatestThenFollows) {
    EventStream<int> s;
    s.emit(1);
    s.emit(2);

    std::vector<int> seen;
    bool done = false;
    auto sub = s.subscribe([&](int const& v) { seen.push_back(v); },
                           [&] { done = true; });
    s.emit(3);
    s.complete();
    s.emit(4);

    EXPECT_EQ(seen, (std::vector<int>{2, 3}));
    EXPECT_TRUE(done);
    EXPECT_EQ(s.latest(), 3);
}

TEST(EventStreamTest, DroppingSubscriptionUnsubscribes) {
    EventStream<int> s;
    int calls = 0;
    {
        auto sub = s.subscribe([&](int const&) { ++calls; });
        s.emit(1);
    }
    s.emit(2);
    EXPECT_EQ(calls, 1);
}

TEST(EventStreamTest, SubscribeAfterCompletion) {
    EventStream<int> s;
    s.emit(7);
    s.complete();

    int last = 0;
    bool done = false;
    auto sub = s.subscribe([&](int const& v) { last = v; },
                           [&] { done = true; });
    EXPECT_EQ(last, 7);
    EXPECT_TRUE(done);
}

TEST(CloseNotifierTest, FiresOnce) {
    CloseNotifier n;
    int calls = 0;
    auto sub = n.subscribe([&] { ++calls; });
    n.notify();
    n.notify();
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(n.fired());

    auto late = n.subscribe([&] { ++calls; });
    EXPECT_EQ(calls, 2);
}

TEST(TransportEventRegistryTest, SameKeySameStream) {
    TransportEventRegistry reg;
    reg.stream(MAX_CONCURRENCY).emit(3);
    EXPECT_EQ(reg.stream(MAX_CONCURRENCY).latest(), std::size_t{3});

    reg.complete_all();
    EXPECT_TRUE(reg.stream(MAX_CONCURRENCY).completed());
}

TEST(BoundedQueueTest, OfferRespectsCapacity) {
    BoundedQueue<int> q(2);
    EXPECT_TRUE(q.offer(1));
    EXPECT_TRUE(q.offer(2));
    EXPECT_FALSE(q.offer(3));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.poll(), 1);
    EXPECT_EQ(*q.peek(), 2);
}

TEST(BoundedQueueTest, ZeroCapacityIsUnbounded) {
    BoundedQueue<int> q;
    for (int i = 0; i < 1000; ++i) ASSERT_TRUE(q.offer(i));
    EXPECT_EQ(q.size(), 1000u);
}

TEST(FramingTest, ResponseBodyForbidden) {
    EXPECT_TRUE(response_body_forbidden(http::verb::head, 200));
    EXPECT_TRUE(response_body_forbidden(http::verb::get, 204));
    EXPECT_TRUE(response_body_forbidden(http::verb::get, 304));
    EXPECT_TRUE(response_body_forbidden(http::verb::connect, 200));
    EXPECT_FALSE(response_body_forbidden(http::verb::connect, 407));
    EXPECT_FALSE(response_body_forbidden(http::verb::get, 200));
}

TEST(LoggingTest, LoggerIsNamedAndLevelAdjustable) {
    auto l = lbhttp::logger();
    ASSERT_NE(l, nullptr);
    EXPECT_EQ(l->name(), "lbhttp");
    EXPECT_EQ(spdlog::get("lbhttp"), l);

    auto before = l->level();
    lbhttp::set_log_level(spdlog::level::debug);
    EXPECT_TRUE(l->should_log(spdlog::level::debug));
    lbhttp::set_log_level(before);
}
