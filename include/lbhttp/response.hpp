#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <vector>

#include "http_method.hpp"
#include "request.hpp"

namespace lbhttp {

    /**
     * @brief A response as produced by a connection: header plus the body
     * chunks in the order they were read.
     */
    struct StreamingHttpResponse {
        http::response_header<> header;
        std::vector<std::string> payload;
        std::optional<http::fields> trailers;
    };

    /**
     * @brief An aggregated HTTP response.
     */
    struct HttpResponse {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP version, 11 for HTTP/1.1. */
        unsigned version{11};
        /** @brief HTTP response headers. */
        http::fields headers;
        /** @brief HTTP response body as a string. */
        std::string body;
        std::optional<http::fields> trailers;

        std::string header(http::field f) const {
            auto v = headers[f];
            return std::string(v.data(), v.size());
        }
    };

    /// @brief Convert a Boost.Beast HTTP response to a StreamingHttpResponse.
    inline StreamingHttpResponse from_beast_response(
        http::response<http::string_body>&& beast_res) {
        StreamingHttpResponse out;
        out.header = std::move(beast_res.base());
        if (!beast_res.body().empty()) {
            out.payload.push_back(std::move(beast_res.body()));
        }
        return out;
    }

    /// @brief Aggregate a streaming response. Chunks are concatenated.
    inline HttpResponse to_response(StreamingHttpResponse&& res) {
        HttpResponse out;
        out.status_code = static_cast<int>(res.header.result_int());
        out.version = res.header.version();
        out.headers = std::move(static_cast<http::fields&>(res.header));
        std::size_t n = 0;
        for (auto const& c : res.payload) n += c.size();
        out.body.reserve(n);
        for (auto& c : res.payload) out.body += c;
        out.trailers = std::move(res.trailers);
        return out;
    }

    /**
     * @brief Creates aggregated requests and responses for a client or
     * connection.
     */
    class HttpRequestResponseFactory {
       public:
        explicit HttpRequestResponseFactory(std::string user_agent = {})
            : user_agent_(std::move(user_agent)) {}

        HttpRequest new_request(HttpRequestMethod const& method,
                                std::string_view target) const {
            HttpRequest req;
            req.meta = new_request_meta(method, target);
            if (!user_agent_.empty()) {
                req.meta.header.set(http::field::user_agent, user_agent_);
            }
            return req;
        }

        HttpResponse new_response(http::status status) const {
            HttpResponse res;
            res.status_code = static_cast<int>(status);
            return res;
        }

       private:
        std::string user_agent_;
    };

}  // namespace lbhttp
