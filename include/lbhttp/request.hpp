#pragma once
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "context_map.hpp"
#include "http_method.hpp"

namespace lbhttp {

    /// @brief Start-line and headers of a request plus its context.
    struct HttpRequestMetaData {
        http::request_header<> header;
        ContextMap context;

        HttpRequestMethod method() const {
            auto ms = header.method_string();
            return HttpRequestMethod(std::string_view(ms.data(), ms.size()));
        }

        std::string target() const {
            auto t = header.target();
            return std::string(t.data(), t.size());
        }
    };

    /**
     * @brief A request whose body is a sequence of chunks written in order.
     */
    struct StreamingHttpRequest {
        HttpRequestMetaData meta;
        std::vector<std::string> payload;
        std::optional<http::fields> trailers;
    };

    /**
     * @brief A request with its whole body in memory.
     */
    struct HttpRequest {
        HttpRequestMetaData meta;
        std::string payload;
        std::optional<http::fields> trailers;

        StreamingHttpRequest to_streaming() && {
            StreamingHttpRequest out;
            out.meta = std::move(meta);
            if (!payload.empty()) out.payload.push_back(std::move(payload));
            out.trailers = std::move(trailers);
            return out;
        }
    };

    /// @brief Apply headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    /// @brief Build request metadata for method + target, HTTP/1.1.
    inline HttpRequestMetaData new_request_meta(
        HttpRequestMethod const& method, std::string_view target) {
        HttpRequestMetaData meta;
        meta.header.version(11);
        if (method.is_extension()) {
            meta.header.method_string(
                boost::beast::string_view(method.name().data(),
                                          method.name().size()));
        } else {
            meta.header.method(method.verb());
        }
        meta.header.target(
            boost::beast::string_view(target.data(), target.size()));
        return meta;
    }

}  // namespace lbhttp
