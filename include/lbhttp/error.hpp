#pragma once
#include <string>

namespace lbhttp {
    /**
     * @brief Represents an error that occurred while connecting, encoding or
     * exchanging a request.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidRequest,        /**< The request metadata cannot be encoded. */
            ConnectionFailed,      /**< Failed to establish a transport connection. */
            FilterFailed,          /**< A connection or factory filter failed. */
            ProtocolBindingFailed, /**< Binding the protocol adapter failed. */
            QueueFull,             /**< The decoder signal queue rejected an entry. */
            EncodeFailed,          /**< The encoder is in a state that forbids the call. */
            SendFailed,            /**< Failed to write to the transport. */
            ReceiveFailed,         /**< Failed to read or parse the response. */
            ConnectionClosed,      /**< The connection or client is closed. */
            Rejected,              /**< No permit or reservation was available. */
            WouldBlockIoThread,    /**< A blocking call was made on the I/O thread. */
            Timeout,               /**< The operation timed out. */
            Unknown,               /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidRequest:
                return "InvalidRequest";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::FilterFailed:
                return "FilterFailed";
            case Error::Code::ProtocolBindingFailed:
                return "ProtocolBindingFailed";
            case Error::Code::QueueFull:
                return "QueueFull";
            case Error::Code::EncodeFailed:
                return "EncodeFailed";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::ConnectionClosed:
                return "ConnectionClosed";
            case Error::Code::Rejected:
                return "Rejected";
            case Error::Code::WouldBlockIoThread:
                return "WouldBlockIoThread";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace lbhttp
