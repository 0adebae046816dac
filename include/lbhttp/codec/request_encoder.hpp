#pragma once

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/fields.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "lbhttp/codec/framing_queues.hpp"
#include "lbhttp/request.hpp"
#include "lbhttp/result.hpp"

namespace lbhttp {

    /// @brief The peer answered "100 Continue"; the deferred body may go out.
    struct ContinueEvent {};
    /// @brief The pending body must not be written (final response arrived
    /// first, or the caller gave up).
    struct CancelWriteEvent {};

    /// @brief Connection-scoped notifications the encoder reacts to.
    using ConnectionEvent = std::variant<ContinueEvent, CancelWriteEvent>;

    /**
     * @brief HTTP/1.1 request encoder for one connection.
     *
     * Serializes start-line, headers and body of successive requests into a
     * Beast dynamic buffer and, per request, pushes the method onto the
     * method queue and a Signal onto the signal queue shared with the
     * response decoder.
     *
     * SAFETY: not thread-safe. All calls for one connection happen on that
     * connection's I/O executor, one request at a time.
     *
     * STATES:
     *  Idle          -> ready for the next request's metadata
     *  ContentLength -> body framed by Content-Length, tracking remaining
     *  Chunked       -> body framed by chunked transfer-coding
     *  Broken        -> the signal queue overflowed; nothing more is encoded
     */
    class RequestEncoder {
       public:
        enum class State { Idle, ContentLength, Chunked, Broken };

        using Buffer = boost::beast::flat_buffer;
        using EventHandler = std::function<void(ConnectionEvent const&)>;

        /// @param queues Shared with the paired decoder.
        /// @param downstream Receives every ConnectionEvent after the
        /// encoder has updated its own state.
        explicit RequestEncoder(std::shared_ptr<FramingQueues> queues,
                                EventHandler downstream = {});

        /// @brief Encode the start-line and headers of the next request.
        ///
        /// Enqueues the method and the request's Signal. On QueueFull the
        /// encoder is Broken and the connection must not be reused.
        Status encode_meta(HttpRequestMetaData const& meta, Buffer& out);

        /// @brief Encode one body chunk of the current request.
        Status encode_payload(std::string_view chunk, Buffer& out);

        /// @brief Finish the current request. In chunked mode writes the
        /// last chunk and optional trailers.
        Status encode_end(http::fields const* trailers, Buffer& out);

        /// @brief React to ContinueEvent / CancelWriteEvent, then forward
        /// the event downstream unchanged.
        void on_event(ConnectionEvent const& evt);

        /// @brief True from encoding a request with Expect: 100-continue
        /// until a ContinueEvent or CancelWriteEvent arrives.
        bool expect_continue() const noexcept { return expect_continue_; }

        State state() const noexcept { return state_; }

        /// @brief Declared bytes still owed by the current request, in
        /// ContentLength state.
        std::optional<std::uint64_t> remaining_content_length() const noexcept;

        /// @brief Body bytes written for the current (or last) request,
        /// excluding chunk framing.
        std::uint64_t payload_bytes_written() const noexcept {
            return payload_written_;
        }

        /// @brief True when the last request was finished by a
        /// CancelWriteEvent instead of encode_end().
        bool last_content_cancelled() const noexcept {
            return content_cancelled_;
        }

       private:
        void encode_initial_line(HttpRequestMetaData const& meta, Buffer& out);
        void content_consumed() noexcept;

        std::shared_ptr<FramingQueues> queues_;
        EventHandler downstream_;

        State state_{State::Idle};
        bool expect_continue_{false};
        bool content_cancelled_{false};
        std::uint64_t remaining_{0};
        std::uint64_t payload_written_{0};
    };

    inline const char* to_string(RequestEncoder::State s) {
        switch (s) {
            case RequestEncoder::State::Idle:
                return "Idle";
            case RequestEncoder::State::ContentLength:
                return "ContentLength";
            case RequestEncoder::State::Chunked:
                return "Chunked";
            case RequestEncoder::State::Broken:
                return "Broken";
        }
        return "Unknown";
    }

    namespace codec {
        /// @brief Request-target as it goes on the wire: "/" for an empty
        /// target, and a "/" path inserted into absolute-form targets that
        /// have none.
        std::string normalize_request_target(std::string_view target);

        /// @brief True if the last transfer-coding is "chunked".
        bool is_transfer_encoding_chunked(http::fields const& fields);

        /// @brief True for "Expect: 100-continue" (case-insensitive).
        bool is_expect_continue(http::fields const& fields);

        /// @brief Parsed Content-Length. nullopt if absent, error if
        /// malformed.
        Result<std::optional<std::uint64_t>> content_length(
            http::fields const& fields);
    }  // namespace codec

}  // namespace lbhttp
