#include "lbhttp/connection/tcp_connection.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/error.hpp>

namespace lbhttp {

    namespace {
        void set_sni(HttpsStream& stream, const std::string& host,
                     boost::system::error_code& ec) {
            if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                          host.c_str())) {
                ec = boost::system::error_code(
                    static_cast<int>(::ERR_get_error()),
                    boost::asio::error::get_ssl_category());
            }
        }

        ConnectionResult connect_error(tcp::endpoint const& address,
                                       boost::system::error_code const& ec) {
            return ConnectionResult::err(
                ec == boost::beast::error::timeout ? Error::Code::Timeout
                                                   : Error::Code::ConnectionFailed,
                "connect to " + address.address().to_string() + ":" +
                    std::to_string(address.port()) + " failed: " +
                    ec.message());
        }

        ConnectionResult closed_factory() {
            return ConnectionResult::err(Error::Code::ConnectionClosed,
                                         "connection factory is closed");
        }
    }  // namespace

    TcpConnectionFactory::TcpConnectionFactory(HttpExecutionContext exec,
                                               HttpConnectionConfiguration cfg)
        : exec_(std::move(exec)), cfg_(std::move(cfg)) {}

    boost::asio::awaitable<ConnectionResult>
    TcpConnectionFactory::new_connection(
        tcp::endpoint address, ContextMap const* /*context*/,
        std::shared_ptr<TransportObserver> observer) {
        if (closed_.load()) co_return closed_factory();
        observer = as_safe_observer(std::move(observer));
        observer->on_new_connection(address);

        boost::system::error_code ec;
        HttpStream stream(exec_.io_executor);
        stream.expires_after(cfg_.connect_timeout);
        co_await stream.async_connect(
            address,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            observer->on_connection_closed(
                Error{Error::Code::ConnectionFailed, ec.message()});
            co_return connect_error(address, ec);
        }
        stream.expires_never();

        auto conn = std::make_shared<AsioStreamingHttpConnection<HttpStream>>(
            std::move(stream), exec_, cfg_, std::move(observer), false);
        conn->start();
        co_return ConnectionResult::ok(std::move(conn));
    }

    boost::asio::awaitable<Status> TcpConnectionFactory::close_async() {
        closed_.store(true);
        co_return ok_status();
    }

    TlsConnectionFactory::TlsConnectionFactory(
        HttpExecutionContext exec, HttpConnectionConfiguration cfg,
        boost::asio::ssl::context& ssl_ctx, std::string server_name)
        : exec_(std::move(exec)),
          cfg_(std::move(cfg)),
          ssl_ctx_(ssl_ctx),
          server_name_(std::move(server_name)) {}

    boost::asio::awaitable<ConnectionResult>
    TlsConnectionFactory::new_connection(
        tcp::endpoint address, ContextMap const* /*context*/,
        std::shared_ptr<TransportObserver> observer) {
        if (closed_.load()) co_return closed_factory();
        observer = as_safe_observer(std::move(observer));
        observer->on_new_connection(address);

        boost::system::error_code ec;
        HttpsStream stream(exec_.io_executor, ssl_ctx_);
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(cfg_.connect_timeout);
        co_await lowest.async_connect(
            address,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (!ec && !server_name_.empty()) set_sni(stream, server_name_, ec);
        if (!ec) {
            co_await stream.async_handshake(
                boost::asio::ssl::stream_base::client,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        if (ec) {
            observer->on_connection_closed(
                Error{Error::Code::ConnectionFailed, ec.message()});
            co_return connect_error(address, ec);
        }
        lowest.expires_never();

        auto conn = std::make_shared<AsioStreamingHttpConnection<HttpsStream>>(
            std::move(stream), exec_, cfg_, std::move(observer), true);
        conn->start();
        co_return ConnectionResult::ok(std::move(conn));
    }

    boost::asio::awaitable<Status> TlsConnectionFactory::close_async() {
        closed_.store(true);
        co_return ok_status();
    }

}  // namespace lbhttp
