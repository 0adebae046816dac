#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

#include "lbhttp/connection/concurrency_controller.hpp"
#include "lbhttp/event_stream.hpp"

using namespace lbhttp;

namespace {
    using Controller = ReservableRequestConcurrencyController;
}

TEST(ConcurrencyControllerTest, GrantsUpToMax) {
    auto c = Controller::create(2);
    auto p1 = c->try_acquire();
    auto p2 = c->try_acquire();
    auto p3 = c->try_acquire();
    EXPECT_TRUE(p1);
    EXPECT_TRUE(p2);
    EXPECT_FALSE(p3);
    EXPECT_EQ(c->granted(), 2u);
    EXPECT_EQ(c->state(), Controller::State::Exhausted);

    p1.release();
    EXPECT_EQ(c->granted(), 1u);
    EXPECT_TRUE(c->try_acquire());
}

TEST(ConcurrencyControllerTest, ReleaseIsIdempotent) {
    auto c = Controller::create(3);
    auto p1 = c->try_acquire();
    auto p2 = c->try_acquire();
    p1.release();
    p1.release();
    EXPECT_EQ(c->granted(), 1u);
}

TEST(ConcurrencyControllerTest, MovedPermitReleasesOnce) {
    auto c = Controller::create(1);
    {
        auto p1 = c->try_acquire();
        Controller::Permit p2 = std::move(p1);
        EXPECT_FALSE(p1);
        EXPECT_TRUE(p2);
        EXPECT_EQ(c->granted(), 1u);
    }
    EXPECT_EQ(c->granted(), 0u);
}

TEST(ConcurrencyControllerTest, ShrinkingMaxKeepsOutstandingPermits) {
    auto c = Controller::create(10);
    std::vector<Controller::Permit> held;
    for (int i = 0; i < 3; ++i) held.push_back(c->try_acquire());

    c->update_max_concurrency(2);
    EXPECT_EQ(c->granted(), 3u);
    EXPECT_FALSE(c->try_acquire());

    held.pop_back();
    EXPECT_FALSE(c->try_acquire());  // 2 granted, max 2
    held.pop_back();
    EXPECT_TRUE(c->try_acquire());
}

TEST(ConcurrencyControllerTest, FollowsMaxConcurrencyStream) {
    EventStream<std::size_t> stream;
    stream.emit(1);

    auto c = Controller::create(5);
    c->subscribe(&stream, nullptr);
    EXPECT_EQ(c->max_concurrency(), 1u);  // replayed

    stream.emit(4);
    EXPECT_EQ(c->max_concurrency(), 4u);

    // Completion alone does not close.
    stream.complete();
    EXPECT_FALSE(c->closed());
}

TEST(ConcurrencyControllerTest, ClosingNotificationClosesForGood) {
    CloseNotifier closing;
    auto c = Controller::create(4);
    c->subscribe(nullptr, &closing);

    auto held = c->try_acquire();
    closing.notify();
    EXPECT_TRUE(c->closed());
    EXPECT_EQ(c->state(), Controller::State::Closed);

    AcquireOutcome outcome = AcquireOutcome::Accepted;
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(c->try_acquire(outcome));
        EXPECT_EQ(outcome, AcquireOutcome::RejectedPermanently);
        EXPECT_FALSE(c->try_reserve());
    }

    // Releasing after close is harmless.
    held.release();
    EXPECT_FALSE(c->try_acquire());
}

TEST(ConcurrencyControllerTest, CloseIsIdempotent) {
    auto c = Controller::create(1);
    c->close();
    c->close();
    EXPECT_TRUE(c->closed());
}

TEST(ConcurrencyControllerTest, SubscribeToFiredNotifierClosesImmediately) {
    CloseNotifier closing;
    closing.notify();
    auto c = Controller::create(1);
    c->subscribe(nullptr, &closing);
    EXPECT_TRUE(c->closed());
}

TEST(ConcurrencyControllerTest, ReservationIsExclusive) {
    auto c = Controller::create(4);
    auto r = c->try_reserve();
    ASSERT_TRUE(r);
    EXPECT_EQ(c->state(), Controller::State::Reserved);

    AcquireOutcome outcome = AcquireOutcome::Accepted;
    EXPECT_FALSE(c->try_acquire(outcome));
    EXPECT_EQ(outcome, AcquireOutcome::RejectedTemporary);
    EXPECT_FALSE(c->try_reserve());

    r.release();
    EXPECT_TRUE(c->try_acquire());
}

TEST(ConcurrencyControllerTest, ReserveFailsWhilePermitOutstanding) {
    auto c = Controller::create(4);
    auto p = c->try_acquire();
    EXPECT_FALSE(c->try_reserve());
    p.release();
    EXPECT_TRUE(c->try_reserve());
}

TEST(ConcurrencyControllerTest, PermitOutlivingControllerIsInert) {
    Controller::Permit p;
    {
        auto c = Controller::create(1);
        p = c->try_acquire();
        ASSERT_TRUE(p);
    }
    p.release();
    EXPECT_FALSE(p);
}
