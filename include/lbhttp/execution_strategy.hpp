#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <optional>

#include "lbhttp/context_map.hpp"

namespace lbhttp {

    /**
     * @brief Which parts of an HTTP exchange are moved off the I/O thread.
     *
     * Default is the explicit "unspecified" value; it is resolved to a
     * concrete strategy once, by whoever consumes the configuration.
     */
    enum class HttpExecutionStrategy : std::uint8_t {
        Default,      /**< Not specified by the user. */
        OffloadNone,  /**< Everything runs on the I/O thread. */
        OffloadSend,  /**< Producing the request body is offloaded. */
        OffloadReceive, /**< Consuming the response is offloaded. */
        OffloadAll,   /**< Send and receive are offloaded. */
    };

    inline const char* to_string(HttpExecutionStrategy s) {
        switch (s) {
            case HttpExecutionStrategy::Default:
                return "Default";
            case HttpExecutionStrategy::OffloadNone:
                return "OffloadNone";
            case HttpExecutionStrategy::OffloadSend:
                return "OffloadSend";
            case HttpExecutionStrategy::OffloadReceive:
                return "OffloadReceive";
            case HttpExecutionStrategy::OffloadAll:
                return "OffloadAll";
        }
        return "Unknown";
    }

    /// @brief Strategy used by the blocking adapter when the user left it
    /// unspecified. Blocking user code may block while producing a request,
    /// so sends are offloaded.
    inline constexpr HttpExecutionStrategy
        DEFAULT_BLOCKING_CONNECTION_STRATEGY =
            HttpExecutionStrategy::OffloadSend;

    /// @brief Context key the blocking adapter uses to pin the strategy on a
    /// request.
    inline const ContextKey<HttpExecutionStrategy>
        HTTP_EXECUTION_STRATEGY_KEY{"lbhttp.http-execution-strategy"};

    /**
     * @brief Strategy in effect when a connection is created.
     *
     * It may be connect-aware (knows whether connect is offloaded),
     * HTTP-aware (carries an HttpExecutionStrategy), or both.
     */
    class ExecutionStrategy {
       public:
        static ExecutionStrategy connect(bool offload_connect) {
            ExecutionStrategy s;
            s.connect_aware_ = true;
            s.offload_connect_ = offload_connect;
            return s;
        }

        static ExecutionStrategy http(HttpExecutionStrategy strategy) {
            ExecutionStrategy s;
            s.http_ = strategy;
            return s;
        }

        static ExecutionStrategy connect_and_http(
            bool offload_connect, HttpExecutionStrategy strategy) {
            ExecutionStrategy s = connect(offload_connect);
            s.http_ = strategy;
            return s;
        }

        bool is_connect_aware() const noexcept { return connect_aware_; }

        bool is_connect_offloaded() const noexcept {
            return connect_aware_ && offload_connect_;
        }

        /// @return The HTTP strategy, or nullopt if this strategy is not
        /// HTTP-aware.
        std::optional<HttpExecutionStrategy> http_strategy() const noexcept {
            return http_;
        }

       private:
        ExecutionStrategy() = default;

        bool connect_aware_{false};
        bool offload_connect_{false};
        std::optional<HttpExecutionStrategy> http_;
    };

    /**
     * @brief Executors and strategy a client or connection runs with.
     */
    struct HttpExecutionContext {
        /// @brief The I/O-owning executor. All reads/writes of a connection
        /// run here.
        boost::asio::io_context::executor_type io_executor;

        /// @brief Worker executor used for offloading.
        boost::asio::any_io_executor executor;

        HttpExecutionStrategy strategy{HttpExecutionStrategy::Default};

        bool in_io_thread() const noexcept {
            return io_executor.running_in_this_thread();
        }
    };

}  // namespace lbhttp
