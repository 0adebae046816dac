#include "lbhttp/client.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <stdexcept>

#include "lbhttp/connection/tcp_connection.hpp"
#include "lbhttp/execution_strategy.hpp"
#include "lbhttp/logging.hpp"

namespace lbhttp {

    SingleAddressStreamingHttpClient::SingleAddressStreamingHttpClient(
        std::shared_ptr<LBHttpConnectionFactory> factory,
        tcp::endpoint address, HttpClientConfiguration cfg)
        : factory_(std::move(factory)),
          address_(std::move(address)),
          cfg_(std::move(cfg)),
          req_res_factory_(cfg_.connection.user_agent) {
        if (!factory_) {
            throw std::invalid_argument(
                "SingleAddressStreamingHttpClient: null connection factory");
        }
        if (cfg_.max_connections == 0) {
            throw std::invalid_argument(
                "SingleAddressStreamingHttpClient: max_connections must be > 0");
        }
        waiters_ = std::make_shared<ConnectWaiters>(
            factory_->execution_context().io_executor);
    }

    std::shared_ptr<SingleAddressStreamingHttpClient>
    SingleAddressStreamingHttpClient::create_tcp(
        HttpExecutionContext exec, tcp::endpoint address,
        HttpClientConfiguration cfg, ExecutionStrategy connect_strategy) {
        auto supplier = std::make_shared<TcpConnectionFactory>(exec, cfg.connection);
        LBHttpConnectionFactory::Options options;
        options.config = cfg.connection;
        auto factory = std::make_shared<LBHttpConnectionFactory>(
            std::move(exec), connect_strategy, std::move(supplier),
            std::move(options));
        return std::make_shared<SingleAddressStreamingHttpClient>(
            std::move(factory), std::move(address), std::move(cfg));
    }

    bool SingleAddressStreamingHttpClient::try_grant_locked(Pick pick,
                                                            Selected& out) {
        // Closed connections never grant again; drop them.
        connections_.erase(
            std::remove_if(connections_.begin(), connections_.end(),
                           [](LbConnection const& c) {
                               return c->controller().closed();
                           }),
            connections_.end());

        for (auto const& c : connections_) {
            if (pick == Pick::Permit) {
                if (auto p = c->try_request()) {
                    out.conn = c;
                    out.permit = std::move(p);
                    return true;
                }
            } else if (auto r = c->try_reserve()) {
                out.conn = c;
                out.reservation = std::move(r);
                return true;
            }
        }
        return false;
    }

    boost::asio::awaitable<void>
    SingleAddressStreamingHttpClient::wait_for_connect(std::uint64_t settled) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_ || connects_settled_ != settled) co_return;
        }
        auto timer = std::make_shared<boost::asio::steady_timer>(
            waiters_->strand);
        timer->expires_at(std::chrono::steady_clock::time_point::max());
        waiters_->timers.push_back(timer);

        // Only wake_connect_waiters() cancels it.
        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    void SingleAddressStreamingHttpClient::wake_connect_waiters() {
        auto w = waiters_;
        boost::asio::post(w->strand, [w] {
            for (auto& t : w->timers) t->cancel();
            w->timers.clear();
        });
    }

    boost::asio::awaitable<Result<SingleAddressStreamingHttpClient::Selected>>
    SingleAddressStreamingHttpClient::select(Pick pick,
                                             ContextMap const& context) {
        using R = Result<Selected>;
        for (;;) {
            bool wait = false;
            std::uint64_t settled = 0;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (closed_) {
                    co_return R::err(Error::Code::ConnectionClosed,
                                     "client is closed");
                }
                Selected sel;
                if (try_grant_locked(pick, sel)) co_return R::ok(std::move(sel));
                if (connections_.size() + pending_ >= cfg_.max_connections) {
                    if (pending_ == 0) {
                        co_return R::err(Error::Code::Rejected,
                                         "no connection available");
                    }
                    wait = true;
                    settled = connects_settled_;
                } else {
                    ++pending_;
                }
            }

            if (wait) {
                co_await boost::asio::co_spawn(waiters_->strand,
                                               wait_for_connect(settled),
                                               boost::asio::use_awaitable);
                continue;
            }

            auto created = co_await factory_->new_connection(address_, &context);

            Selected sel;
            bool granted = false;
            bool client_closed = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                --pending_;
                ++connects_settled_;
                client_closed = closed_;
                if (created && !closed_) {
                    connections_.push_back(created.value());
                    // The caller that connected is served before any waiter.
                    granted = try_grant_locked(pick, sel);
                }
            }
            wake_connect_waiters();

            if (!created) co_return created.forward_error<Selected>();
            if (client_closed) {
                // Closed while connecting; the caller gets the error and the
                // fresh connection is dropped (its destructor closes it).
                co_return R::err(Error::Code::ConnectionClosed,
                                 "client is closed");
            }
            if (granted) co_return R::ok(std::move(sel));
        }
    }

    boost::asio::awaitable<Result<StreamingHttpResponse>>
    SingleAddressStreamingHttpClient::request(StreamingHttpRequest req) {
        auto sel = co_await select(Pick::Permit, req.meta.context);
        if (!sel) co_return sel.forward_error<StreamingHttpResponse>();

        Selected s = std::move(sel).value();
        if (auto const* strategy =
                req.meta.context.get(HTTP_EXECUTION_STRATEGY_KEY)) {
            logger()->trace("request with strategy {} on connection with {}",
                            to_string(*strategy),
                            to_string(s.conn->strategy()));
        }
        // The permit is held until the exchange is over.
        co_return co_await s.conn->request(std::move(req));
    }

    boost::asio::awaitable<
        Result<std::shared_ptr<ReservedStreamingHttpConnection>>>
    SingleAddressStreamingHttpClient::reserve_connection(
        HttpRequestMetaData meta) {
        using R = Result<std::shared_ptr<ReservedStreamingHttpConnection>>;
        auto sel = co_await select(Pick::Reservation, meta.context);
        if (!sel) {
            co_return sel
                .forward_error<std::shared_ptr<ReservedStreamingHttpConnection>>();
        }

        Selected s = std::move(sel).value();
        co_return R::ok(std::make_shared<ReservedLoadBalancedConnection>(
            std::move(s.conn), std::move(s.reservation)));
    }

    boost::asio::awaitable<Status> SingleAddressStreamingHttpClient::close_all(
        bool graceful) {
        std::vector<LbConnection> conns;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) co_return ok_status();
            closed_ = true;
            conns.swap(connections_);
        }
        wake_connect_waiters();

        Status first = ok_status();
        for (auto& c : conns) {
            Status st = ok_status();
            if (graceful) {
                st = co_await c->close_async_gracefully();
            } else {
                st = co_await c->close_async();
            }
            if (!st && first) first = st;
        }
        Status st = ok_status();
        if (graceful) {
            st = co_await factory_->close_async_gracefully();
        } else {
            st = co_await factory_->close_async();
        }
        if (!st && first) first = st;
        co_return first;
    }

    boost::asio::awaitable<Status>
    SingleAddressStreamingHttpClient::close_async() {
        return close_all(false);
    }

    boost::asio::awaitable<Status>
    SingleAddressStreamingHttpClient::close_async_gracefully() {
        return close_all(true);
    }

    std::size_t SingleAddressStreamingHttpClient::connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

}  // namespace lbhttp
