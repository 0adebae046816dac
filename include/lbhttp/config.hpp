#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace lbhttp {
    /**
     * @brief Per-connection configuration shared by the connection factory
     * and the transport.
     */
    struct HttpConnectionConfiguration {
        /** @brief Initial max-concurrency advertised by a fresh HTTP/1.1
         * connection. 1 disables pipelining. */
        std::size_t max_pipelined_requests{1};

        /** @brief Capacity of the encoder -> decoder signal queue. 0 means
         * unbounded. */
        std::size_t signal_queue_capacity{0};

        /** @brief Maximum size of aggregated response bodies in bytes. */
        std::size_t max_response_body_bytes{static_cast<std::size_t>(10) *
                                            1024U * 1024U};

        /** @brief User-Agent header added when the request has none. */
        std::string user_agent{"lbhttp_client/1.0"};

        /** @brief Timeout for establishing a connection. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Timeout for one request/response exchange. */
        std::chrono::milliseconds request_timeout{5000};
    };

    /**
     * @brief Configuration for SingleAddressStreamingHttpClient.
     */
    struct HttpClientConfiguration {
        HttpConnectionConfiguration connection;

        /** @brief Maximum number of connections the client opens. */
        std::size_t max_connections{4};
    };
}  // namespace lbhttp
