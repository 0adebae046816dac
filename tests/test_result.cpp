#include <string>

#include "gtest/gtest.h"
#include "lbhttp/error.hpp"
#include "lbhttp/result.hpp"

using lbhttp::Error;
using lbhttp::Result;
using lbhttp::Status;

TEST(ResultTest, OkAndHasValue) {
    auto r = Result<int>::ok(42);
    EXPECT_TRUE(r.has_value());
    EXPECT_FALSE(r.has_error());
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrorAndHasError) {
    Error err{Error::Code::ConnectionFailed, "fail"};
    auto r = Result<int>::err(err);
    EXPECT_TRUE(r.has_error());
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "fail");
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
}

TEST(ResultTest, ErrShorthandBuildsError) {
    auto r = Result<int>::err(Error::Code::QueueFull, "full");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::QueueFull);
    EXPECT_EQ(r.error().message, "full");
}

TEST(ResultTest, DefaultConstructedHoldsUnknownError) {
    Result<std::string> r;
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Unknown);
}

TEST(ResultTest, ValueOrElseReturnsValue) {
    auto r = Result<std::string>::ok("hello");
    auto val = r.value_or_else([] { return std::string("fallback"); });
    EXPECT_EQ(val, "hello");
}

TEST(ResultTest, ValueOrElseReturnsFallback) {
    Error err{Error::Code::Timeout, "fail"};
    auto r = Result<std::string>::err(err);
    auto val = r.value_or_else([] { return std::string("fallback"); });
    EXPECT_EQ(val, "fallback");
}

TEST(ResultTest, ValueOrReturnsValue) {
    auto r = Result<int>::ok(7);
    EXPECT_EQ(r.value_or(99), 7);
}

TEST(ResultTest, ValueOrReturnsFallback) {
    Error err{Error::Code::ReceiveFailed, "fail"};
    auto r = Result<int>::err(err);
    EXPECT_EQ(r.value_or(99), 99);
}

TEST(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto r = Result<int>::err(Error::Code::FilterFailed, "filter");
    auto f = r.forward_error<std::string>();
    ASSERT_TRUE(f.has_error());
    EXPECT_EQ(f.error().code, Error::Code::FilterFailed);
    EXPECT_EQ(f.error().message, "filter");
}

TEST(ResultTest, StatusOk) {
    Status s = lbhttp::ok_status();
    EXPECT_TRUE(s);
}

TEST(ErrorTest, ToStringNamesEveryCode) {
    EXPECT_STREQ(lbhttp::to_string(Error::Code::WouldBlockIoThread),
                 "WouldBlockIoThread");
    EXPECT_STREQ(lbhttp::to_string(Error::Code::ProtocolBindingFailed),
                 "ProtocolBindingFailed");
    EXPECT_STREQ(lbhttp::to_string(Error::Code::Rejected), "Rejected");
}
