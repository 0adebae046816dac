#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

#include "lbhttp/http_method.hpp"

namespace lbhttp {

    /// @brief What the decoder must know about the request a response
    /// belongs to, beyond its method.
    enum class Signal {
        Request,                   ///< Plain request.
        RequestWithExpectContinue  ///< Request sent with Expect: 100-continue.
    };

    inline const char* to_string(Signal s) {
        switch (s) {
            case Signal::Request:
                return "Request";
            case Signal::RequestWithExpectContinue:
                return "RequestWithExpectContinue";
        }
        return "Unknown";
    }

    /**
     * @brief FIFO with an optional capacity.
     *
     * offer() never blocks; it reports a full queue instead. Not
     * synchronized: encoder and decoder of one connection both run on that
     * connection's I/O executor.
     */
    template <typename T>
    class BoundedQueue {
       public:
        /// @param capacity Maximum size, 0 for unbounded.
        explicit BoundedQueue(std::size_t capacity = 0) : capacity_(capacity) {}

        /// @return false if the queue is at capacity; the value is dropped.
        [[nodiscard]] bool offer(T value) {
            if (capacity_ != 0 && items_.size() >= capacity_) return false;
            items_.push_back(std::move(value));
            return true;
        }

        std::optional<T> poll() {
            if (items_.empty()) return std::nullopt;
            T v = std::move(items_.front());
            items_.pop_front();
            return v;
        }

        const T* peek() const {
            return items_.empty() ? nullptr : &items_.front();
        }

        std::size_t size() const noexcept { return items_.size(); }
        bool empty() const noexcept { return items_.empty(); }
        std::size_t capacity() const noexcept { return capacity_; }
        void clear() noexcept { items_.clear(); }

       private:
        std::size_t capacity_;
        std::deque<T> items_;
    };

    /**
     * @brief The two queues an encoder and its paired decoder share.
     *
     * Owned by the connection, handed to both sides. Entries are produced in
     * request write order and consumed in the same order.
     */
    struct FramingQueues {
        explicit FramingQueues(std::size_t signal_capacity = 0)
            : signals(signal_capacity) {}

        BoundedQueue<HttpRequestMethod> methods;
        BoundedQueue<Signal> signals;
    };

    /// @brief Decoder side: true if a response to `method` with `status`
    /// carries no body regardless of its headers (RFC 7230 3.3.3 rules 1-2).
    inline bool response_body_forbidden(http::verb method,
                                        unsigned status) noexcept {
        if (method == http::verb::head) return true;
        if (status / 100 == 1 || status == 204 || status == 304) return true;
        return method == http::verb::connect && status / 100 == 2;
    }

}  // namespace lbhttp
