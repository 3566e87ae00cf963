#include "httpool/connection/tcp_connection.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>

#include "httpool/log.hpp"

namespace httpool {

    bool set_sni(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
                 const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                 bool verify_peer) {
        // Load system default CA certificates
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ssl_context.set_verify_mode(verify_peer
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

    // ---- TcpConnection ----

    TcpConnection::TcpConnection(RequestKey key,
                                 boost::asio::any_io_executor ex,
                                 boost::asio::ssl::context& ssl_ctx)
        : m_key(std::move(key)), m_stream(std::in_place_type<HttpStream>, ex) {
        m_key.normalize();
        if (m_key.https()) m_stream.emplace<HttpsStream>(ex, ssl_ctx);
    }

    boost::beast::tcp_stream& TcpConnection::lowest_layer() noexcept {
        if (auto* s = https_stream()) return boost::beast::get_lowest_layer(*s);
        return std::get<HttpStream>(m_stream);
    }

    bool TcpConnection::is_open() const noexcept {
        if (m_closed.load(std::memory_order_acquire)) return false;

        return std::visit(
            [](auto const& s) -> bool {
                return boost::beast::get_lowest_layer(s).socket().is_open();
            },
            m_stream);
    }

    void TcpConnection::close() noexcept {
        if (m_closed.exchange(true, std::memory_order_acq_rel)) return;

        boost::system::error_code ec;
        auto& socket = lowest_layer().socket();
        if (!socket.is_open()) return;

        // Best effort, a peer that is already gone fails the shutdown
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    // ---- TcpConnectionBuilder ----

    TcpConnectionBuilder::TcpConnectionBuilder(boost::asio::any_io_executor ex,
                                               TcpBuilderConfiguration cfg)
        : m_ex(std::move(ex)),
          m_cfg(cfg),
          m_ssl_ctx(boost::asio::ssl::context::tls_client) {
        init_tls_on_ssl_context(m_ssl_ctx, m_cfg.verify_tls);
    }

    void TcpConnectionBuilder::async_build(RequestKey const& key,
                                           BuildHandler handler) {
        boost::asio::co_spawn(
            m_ex,
            [self = shared_from_this(), key,
             handler = std::move(handler)]() mutable
            -> boost::asio::awaitable<void> {
                std::optional<Result<ConnectionPtr>> r;
                try {
                    r.emplace(co_await self->connect(key));
                } catch (std::exception const& e) {
                    r.emplace(Result<ConnectionPtr>::err(
                        Error::Code::BuildFailed, e.what()));
                }
                handler(std::move(*r));
            },
            boost::asio::detached);
    }

    boost::asio::awaitable<Result<ConnectionPtr>> TcpConnectionBuilder::connect(
        RequestKey key) {
        namespace beast = boost::beast;
        using tcp = boost::asio::ip::tcp;

        auto fail = [&key](Error::Code code, boost::system::error_code ec) {
            return Result<ConnectionPtr>::err(
                code, to_string(key) + ": " + ec.message());
        };

        key.normalize();
        boost::system::error_code ec;

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            key.host, key.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return fail(Error::Code::ResolveFailed, ec);

        auto conn = std::make_shared<TcpConnection>(key, m_ex, m_ssl_ctx);
        beast::tcp_stream& tcp_layer = conn->lowest_layer();

        tcp_layer.expires_after(m_cfg.connect_timeout);
        co_await tcp_layer.async_connect(
            results,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            conn->close();
            co_return fail(ec == beast::error::timeout
                               ? Error::Code::Timeout
                               : Error::Code::ConnectionFailed,
                           ec);
        }

        if (auto* s = conn->https_stream()) {
            if (!set_sni(*s, key.host, ec)) {
                conn->close();
                co_return fail(Error::Code::TlsHandshakeFailed, ec);
            }
            if (m_cfg.verify_tls) {
                s->set_verify_callback(
                    boost::asio::ssl::host_name_verification(key.host));
            }

            co_await s->async_handshake(
                boost::asio::ssl::stream_base::client,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                conn->close();
                co_return fail(ec == beast::error::timeout
                                   ? Error::Code::Timeout
                                   : Error::Code::TlsHandshakeFailed,
                               ec);
            }
        }

        tcp_layer.expires_never();
        log::logger()->debug("Connected to {}", to_string(key));
        co_return Result<ConnectionPtr>::ok(std::move(conn));
    }

}  // namespace httpool
