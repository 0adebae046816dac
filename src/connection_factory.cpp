#include "lbhttp/connection/connection_factory.hpp"

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

#include "lbhttp/logging.hpp"

namespace lbhttp {

    /// Innermost factory: makes the observer safe and offloads the raw
    /// connect when the connect strategy asks for it.
    class LBHttpConnectionFactory::Supplier final : public ConnectionFactory {
       public:
        Supplier(std::shared_ptr<ConnectionFactory> raw,
                 HttpExecutionContext exec, bool offload_connect)
            : raw_(std::move(raw)),
              exec_(std::move(exec)),
              offload_connect_(offload_connect) {}

        boost::asio::awaitable<ConnectionResult> new_connection(
            tcp::endpoint address, ContextMap const* context,
            std::shared_ptr<TransportObserver> observer) override {
            observer = as_safe_observer(std::move(observer));

            // Only hop when we would otherwise connect on the I/O thread.
            if (offload_connect_ && exec_.in_io_thread()) {
                co_return co_await boost::asio::co_spawn(
                    exec_.executor,
                    raw_->new_connection(address, context, std::move(observer)),
                    boost::asio::use_awaitable);
            }
            co_return co_await raw_->new_connection(address, context,
                                                    std::move(observer));
        }

        boost::asio::awaitable<Status> close_async() override {
            if (closed_.exchange(true)) co_return ok_status();
            co_return co_await raw_->close_async();
        }

        boost::asio::awaitable<Status> close_async_gracefully() override {
            if (closed_.exchange(true)) co_return ok_status();
            co_return co_await raw_->close_async_gracefully();
        }

       private:
        std::shared_ptr<ConnectionFactory> raw_;
        HttpExecutionContext exec_;
        bool offload_connect_;
        std::atomic<bool> closed_{false};
    };

    namespace {
        boost::asio::awaitable<void> close_after_failure(
            std::shared_ptr<FilterableStreamingHttpConnection> conn) {
            auto st = co_await conn->close_async();
            if (!st) {
                logger()->debug("closing failed connection: {}",
                                st.error().message);
            }
        }
    }  // namespace

    LBHttpConnectionFactory::LBHttpConnectionFactory(
        HttpExecutionContext exec, ExecutionStrategy connect_strategy,
        std::shared_ptr<ConnectionFactory> supplier, Options options)
        : exec_(std::move(exec)),
          connect_strategy_(connect_strategy),
          options_(std::move(options)) {
        if (!supplier) {
            throw std::invalid_argument(
                "LBHttpConnectionFactory: null connection supplier");
        }

        std::shared_ptr<ConnectionFactory> factory = std::make_shared<Supplier>(
            std::move(supplier), exec_, connect_strategy_.is_connect_offloaded());

        // Wrap innermost first so factory_filters.front() ends up outermost.
        for (auto it = options_.factory_filters.rbegin();
             it != options_.factory_filters.rend(); ++it) {
            factory = (*it)(std::move(factory));
            if (!factory) {
                throw std::invalid_argument(
                    "LBHttpConnectionFactory: factory filter returned null");
            }
        }
        filterable_ = std::move(factory);
    }

    boost::asio::awaitable<Result<LBHttpConnectionFactory::LbConnection>>
    LBHttpConnectionFactory::new_connection(
        tcp::endpoint address, ContextMap const* context,
        std::shared_ptr<TransportObserver> observer) {
        using R = Result<LbConnection>;

        auto raw = co_await filterable_->new_connection(address, context,
                                                        std::move(observer));
        if (!raw) {
            logger()->debug("connect to {}:{} failed: {}",
                            address.address().to_string(), address.port(),
                            raw.error().message);
            co_return raw.forward_error<LbConnection>();
        }
        std::shared_ptr<FilterableStreamingHttpConnection> filtered =
            std::move(raw).value();
        if (!filtered) {
            co_return R::err(Error::Code::ConnectionFailed,
                             "connection supplier returned no connection");
        }

        // The connect result is delivered on the worker executor if it
        // completed on the I/O thread.
        if (connect_strategy_.is_connect_offloaded() && exec_.in_io_thread()) {
            co_return co_await boost::asio::co_spawn(
                exec_.executor, establish(std::move(filtered), address),
                boost::asio::use_awaitable);
        }
        co_return co_await establish(std::move(filtered), address);
    }

    boost::asio::awaitable<Result<LBHttpConnectionFactory::LbConnection>>
    LBHttpConnectionFactory::establish(
        std::shared_ptr<FilterableStreamingHttpConnection> filtered,
        tcp::endpoint address) {
        using R = Result<LbConnection>;

        if (options_.connection_filter) {
            auto f = options_.connection_filter(filtered);
            if (!f || !f.value()) {
                co_await close_after_failure(filtered);
                co_return f ? R::err(Error::Code::FilterFailed,
                                     "connection filter returned null")
                            : f.forward_error<LbConnection>();
            }
            filtered = std::move(f).value();
        }

        // Prefer "closing has begun" over "closed" when the transport has it.
        CloseNotifier* closing = filtered->connection_context().closing();
        CloseNotifier& on_closing = closing ? *closing : filtered->on_close();

        auto controller = ReservableRequestConcurrencyController::create(
            options_.config.max_pipelined_requests);
        controller->subscribe(
            &filtered->transport_events().stream(MAX_CONCURRENCY), &on_closing);

        std::shared_ptr<FilterableStreamingHttpConnection> bound = filtered;
        if (options_.protocol_binding) {
            auto b = options_.protocol_binding(filtered);
            if (!b || !b.value()) {
                co_await close_after_failure(filtered);
                co_return b ? R::err(Error::Code::ProtocolBindingFailed,
                                     "protocol binding returned null")
                            : b.forward_error<LbConnection>();
            }
            bound = std::move(b).value();
        }

        HttpExecutionStrategy const strategy =
            connect_strategy_.http_strategy().value_or(
                HttpExecutionStrategy::OffloadNone);

        logger()->debug("new connection to {}:{} (strategy {})",
                        address.address().to_string(), address.port(),
                        to_string(strategy));
        co_return R::ok(std::make_shared<LoadBalancedStreamingHttpConnection>(
            std::move(bound), std::move(controller), strategy));
    }

    boost::asio::awaitable<Status> LBHttpConnectionFactory::close_async() {
        return filterable_->close_async();
    }

    boost::asio::awaitable<Status>
    LBHttpConnectionFactory::close_async_gracefully() {
        return filterable_->close_async_gracefully();
    }

}  // namespace lbhttp
