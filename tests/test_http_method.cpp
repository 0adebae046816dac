#include <gtest/gtest.h>

#include <boost/beast/http.hpp>

#include "lbhttp/http_method.hpp"

using namespace lbhttp;

TEST(HttpMethodTest, VerbMapping) {
    EXPECT_EQ(HttpRequestMethod(http::verb::post).name(), "POST");
    EXPECT_EQ(HttpRequestMethod(std::string_view("PUT")).verb(),
              boost::beast::http::verb::put);
    EXPECT_EQ(HttpRequestMethod(std::string_view("DELETE")).verb(),
              boost::beast::http::verb::delete_);
    EXPECT_EQ(HttpRequestMethod().verb(), boost::beast::http::verb::get);
}

TEST(HttpMethodTest, ExtensionMethodKeepsName) {
    HttpRequestMethod m{std::string_view("BREW")};
    EXPECT_TRUE(m.is_extension());
    EXPECT_EQ(m.verb(), boost::beast::http::verb::unknown);
    EXPECT_EQ(m.name(), "BREW");
    EXPECT_NE(m, HttpRequestMethod(std::string_view("WHEN")));
    EXPECT_FALSE(HttpRequestMethod(std::string_view("PURGE")).is_extension());
}

TEST(HttpMethodTest, PayloadMethods) {
    EXPECT_TRUE(should_add_zero_content_length(http::verb::post));
    EXPECT_TRUE(should_add_zero_content_length(http::verb::put));
    EXPECT_TRUE(should_add_zero_content_length(http::verb::patch));
    EXPECT_FALSE(should_add_zero_content_length(http::verb::get));
    EXPECT_FALSE(should_add_zero_content_length(http::verb::head));
    EXPECT_FALSE(should_add_zero_content_length(http::verb::connect));
}
