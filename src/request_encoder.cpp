#include "lbhttp/codec/request_encoder.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/rfc7230.hpp>
#include <charconv>
#include <cstdio>

#include "lbhttp/logging.hpp"

namespace lbhttp {

    namespace {
        constexpr std::string_view kCrlf = "\r\n";
        constexpr std::string_view kLastChunk = "0\r\n";

        void put(RequestEncoder::Buffer& out, std::string_view s) {
            if (s.empty()) return;
            auto mb = out.prepare(s.size());
            out.commit(boost::asio::buffer_copy(
                mb, boost::asio::buffer(s.data(), s.size())));
        }

        void put_view(RequestEncoder::Buffer& out,
                      boost::beast::string_view s) {
            put(out, std::string_view(s.data(), s.size()));
        }

        void put_fields(RequestEncoder::Buffer& out, http::fields const& f) {
            for (auto const& field : f) {
                put_view(out, field.name_string());
                put(out, ": ");
                put_view(out, field.value());
                put(out, kCrlf);
            }
        }
    }  // namespace

    namespace codec {

        std::string normalize_request_target(std::string_view target) {
            if (target.empty()) return "/";

            std::string uri(target);
            // Absolute-form: a request-target needs a path, so
            // "http://host" and "http://host?q" gain a "/".
            auto scheme_end = uri.find("://");
            if (scheme_end == std::string::npos || uri.front() == '/') {
                return uri;
            }
            auto const start = scheme_end + 3;
            auto const query = uri.find('?', start);
            if (query == std::string::npos) {
                auto const slash = uri.rfind('/');
                if (slash == std::string::npos || slash < start) uri += '/';
            } else {
                auto const slash = uri.rfind('/', query);
                if (slash == std::string::npos || slash < start) {
                    uri.insert(query, 1, '/');
                }
            }
            return uri;
        }

        bool is_transfer_encoding_chunked(http::fields const& fields) {
            auto it = fields.find(http::field::transfer_encoding);
            if (it == fields.end()) return false;
            http::token_list codings{it->value()};
            bool last_chunked = false;
            for (auto const& c : codings) {
                last_chunked = boost::beast::iequals(c, "chunked");
            }
            return last_chunked;
        }

        bool is_expect_continue(http::fields const& fields) {
            auto it = fields.find(http::field::expect);
            return it != fields.end() &&
                   boost::beast::iequals(it->value(), "100-continue");
        }

        Result<std::optional<std::uint64_t>> content_length(
            http::fields const& fields) {
            using R = Result<std::optional<std::uint64_t>>;
            auto it = fields.find(http::field::content_length);
            if (it == fields.end()) return R::ok(std::nullopt);

            auto v = it->value();
            std::uint64_t n = 0;
            auto const* first = v.data();
            auto const* last = v.data() + v.size();
            auto [p, ec] = std::from_chars(first, last, n);
            if (v.empty() || ec != std::errc{} || p != last) {
                return R::err(Error::Code::InvalidRequest,
                              "malformed Content-Length: " +
                                  std::string(v.data(), v.size()));
            }
            return R::ok(n);
        }

    }  // namespace codec

    RequestEncoder::RequestEncoder(std::shared_ptr<FramingQueues> queues,
                                   EventHandler downstream)
        : queues_(std::move(queues)), downstream_(std::move(downstream)) {}

    std::optional<std::uint64_t> RequestEncoder::remaining_content_length()
        const noexcept {
        if (state_ != State::ContentLength) return std::nullopt;
        return remaining_;
    }

    void RequestEncoder::encode_initial_line(HttpRequestMetaData const& meta,
                                             Buffer& out) {
        put_view(out, meta.header.method_string());
        put(out, " ");
        auto t = meta.header.target();
        put(out, codec::normalize_request_target(
                     std::string_view(t.data(), t.size())));
        put(out, " ");

        unsigned const version = meta.header.version();
        if (version / 10 != 1) {
            // Only HTTP/1.x can be written by this encoder.
            put(out, "HTTP/1.1");
        } else {
            char v[] = "HTTP/1.x";
            v[7] = static_cast<char>('0' + version % 10);
            put(out, std::string_view(v, 8));
        }
        put(out, kCrlf);
    }

    Status RequestEncoder::encode_meta(HttpRequestMetaData const& meta,
                                       Buffer& out) {
        if (state_ == State::Broken) {
            return Status::err(Error::Code::EncodeFailed,
                               "encoder is broken");
        }
        if (state_ != State::Idle) {
            return Status::err(Error::Code::EncodeFailed,
                               "previous request body not finished");
        }

        auto const& fields = static_cast<http::fields const&>(meta.header);
        bool chunked = codec::is_transfer_encoding_chunked(fields);
        std::uint64_t length = 0;
        if (!chunked) {
            auto declared = codec::content_length(fields);
            if (!declared) return Status::err(std::move(declared).error());
            if (declared.value()) {
                length = *declared.value();
            } else if (should_add_zero_content_length(meta.header.method())) {
                // Unknown length on a method that carries a payload.
                if (meta.header.version() == 10) {
                    return Status::err(
                        Error::Code::InvalidRequest,
                        "HTTP/1.0 request without Content-Length");
                }
                chunked = true;
            }
        }
        bool const add_chunked_header =
            chunked && !codec::is_transfer_encoding_chunked(fields);

        // The decoder needs the method before it can frame the response.
        if (!queues_->methods.offer(meta.method())) {
            state_ = State::Broken;
            logger()->error("method queue full, encoder broken");
            return Status::err(Error::Code::QueueFull, "method queue full");
        }

        encode_initial_line(meta, out);
        put_fields(out, fields);
        if (add_chunked_header) put(out, "Transfer-Encoding: chunked\r\n");
        put(out, kCrlf);

        payload_written_ = 0;
        content_cancelled_ = false;
        if (chunked) {
            state_ = State::Chunked;
        } else {
            state_ = State::ContentLength;
            remaining_ = length;
        }

        expect_continue_ = codec::is_expect_continue(fields);
        Signal const signal = expect_continue_
                                  ? Signal::RequestWithExpectContinue
                                  : Signal::Request;
        if (!queues_->signals.offer(signal)) {
            state_ = State::Broken;
            logger()->error(
                "signal queue full (capacity {}), dropping {} and breaking "
                "encoder",
                queues_->signals.capacity(), to_string(signal));
            return Status::err(Error::Code::QueueFull,
                               "decoder signal queue full");
        }
        return ok_status();
    }

    Status RequestEncoder::encode_payload(std::string_view chunk,
                                          Buffer& out) {
        switch (state_) {
            case State::ContentLength:
                if (chunk.size() > remaining_) {
                    return Status::err(
                        Error::Code::EncodeFailed,
                        "payload exceeds declared Content-Length");
                }
                put(out, chunk);
                remaining_ -= chunk.size();
                payload_written_ += chunk.size();
                return ok_status();
            case State::Chunked: {
                // A zero-size chunk would terminate the body.
                if (chunk.empty()) return ok_status();
                char size[24];
                int n = std::snprintf(size, sizeof(size), "%zx\r\n",
                                      chunk.size());
                put(out, std::string_view(size, static_cast<std::size_t>(n)));
                put(out, chunk);
                put(out, kCrlf);
                payload_written_ += chunk.size();
                return ok_status();
            }
            case State::Idle:
                return Status::err(Error::Code::EncodeFailed,
                                   "payload without request metadata");
            case State::Broken:
                break;
        }
        return Status::err(Error::Code::EncodeFailed, "encoder is broken");
    }

    Status RequestEncoder::encode_end(http::fields const* trailers,
                                      Buffer& out) {
        switch (state_) {
            case State::ContentLength:
                if (remaining_ != 0) {
                    return Status::err(
                        Error::Code::EncodeFailed,
                        "payload shorter than declared Content-Length");
                }
                content_consumed();
                return ok_status();
            case State::Chunked:
                put(out, kLastChunk);
                if (trailers) put_fields(out, *trailers);
                put(out, kCrlf);
                content_consumed();
                return ok_status();
            case State::Idle:
                return Status::err(Error::Code::EncodeFailed,
                                   "end without request metadata");
            case State::Broken:
                break;
        }
        return Status::err(Error::Code::EncodeFailed, "encoder is broken");
    }

    void RequestEncoder::content_consumed() noexcept {
        if (state_ != State::Broken) state_ = State::Idle;
        remaining_ = 0;
    }

    void RequestEncoder::on_event(ConnectionEvent const& evt) {
        if (expect_continue_) {
            if (std::holds_alternative<ContinueEvent>(evt)) {
                expect_continue_ = false;
            } else if (std::holds_alternative<CancelWriteEvent>(evt)) {
                // The body will never be written; finish the request as is.
                content_cancelled_ = true;
                content_consumed();
                expect_continue_ = false;
            }
        }
        if (downstream_) downstream_(evt);
    }

}  // namespace lbhttp
