#pragma once
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/verb.hpp>
#include <string>
#include <string_view>

namespace lbhttp {
    namespace http = boost::beast::http;

    /**
     * @brief An HTTP request method as it appears on the wire.
     *
     * Known methods map onto a Beast verb. Extension methods keep
     * http::verb::unknown and carry their token in name().
     */
    class HttpRequestMethod {
       public:
        HttpRequestMethod() = default;

        /*implicit*/ HttpRequestMethod(http::verb verb) : verb_(verb) {
            auto s = http::to_string(verb);
            name_.assign(s.data(), s.size());
        }

        explicit HttpRequestMethod(std::string_view name)
            : verb_(http::string_to_verb(
                  boost::beast::string_view(name.data(), name.size()))),
              name_(name) {}

        http::verb verb() const noexcept { return verb_; }
        const std::string& name() const noexcept { return name_; }

        bool is_extension() const noexcept {
            return verb_ == http::verb::unknown;
        }

        friend bool operator==(HttpRequestMethod const& a,
                               HttpRequestMethod const& b) noexcept {
            return a.verb_ == b.verb_ && a.name_ == b.name_;
        }
        friend bool operator!=(HttpRequestMethod const& a,
                               HttpRequestMethod const& b) noexcept {
            return !(a == b);
        }

       private:
        http::verb verb_{http::verb::get};
        std::string name_{"GET"};
    };

    /// @brief True for methods whose requests carry a payload by convention,
    /// so a missing length must not be read as "empty body".
    /// @note GET, HEAD, DELETE, OPTIONS, TRACE and CONNECT have no defined
    /// payload semantics; everything else (including extension methods) is
    /// assumed to carry one.
    inline constexpr bool should_add_zero_content_length(
        http::verb method) noexcept {
        switch (method) {
            case http::verb::get:
            case http::verb::head:
            case http::verb::delete_:
            case http::verb::options:
            case http::verb::trace:
            case http::verb::connect:
                return false;
            default:
                return true;
        }
    }

}  // namespace lbhttp
