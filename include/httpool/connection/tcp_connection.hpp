#pragma once

#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <string>
#include <variant>

#include "../config.hpp"       // TcpBuilderConfiguration
#include "../request_key.hpp"  // RequestKey
#include "../result.hpp"       // Result, Error
#include "connection.hpp"      // Connection, ConnectionBuilder

namespace httpool {

    /// @brief Set the SNI host name on a TLS stream.
    bool set_sni(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
                 const std::string& host, boost::system::error_code& ec);

    /// @brief Load the system CA store and pick the verification mode.
    /// @throws std::runtime_error if the default verify paths can't be set
    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                 bool verify_peer);

    /**
     * @brief A plain or TLS TCP connection produced by TcpConnectionBuilder.
     *
     * The stream is exposed for the request layer to read and write on. A
     * request layer that sees an I/O error should close() the connection so
     * the pool discards it on release.
     */
    class TcpConnection : public Connection {
       public:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<HttpStream, HttpsStream>;

        /**
         * @brief Constructs an unconnected connection for key.
         * @param ssl_ctx Context for https keys; ignored for http keys.
         */
        TcpConnection(RequestKey key, boost::asio::any_io_executor ex,
                      boost::asio::ssl::context& ssl_ctx);

        TcpConnection(const TcpConnection&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;

        ~TcpConnection() noexcept override { close(); }

        RequestKey const& key() const noexcept override { return m_key; }

        bool is_open() const noexcept override;

        /// @note No TLS shutdown is performed, the TCP socket is just closed.
        void close() noexcept override;

        Stream& stream() noexcept { return m_stream; }

        /// @brief nullptr unless the key is http
        HttpStream* http_stream() noexcept {
            return std::get_if<HttpStream>(&m_stream);
        }

        /// @brief nullptr unless the key is https
        HttpsStream* https_stream() noexcept {
            return std::get_if<HttpsStream>(&m_stream);
        }

        /// @brief The TCP layer under either stream kind.
        boost::beast::tcp_stream& lowest_layer() noexcept;

       private:
        RequestKey m_key;
        Stream m_stream;
        std::atomic<bool> m_closed{false};
    };

    /**
     * @brief Builds TcpConnections: DNS, TCP connect and, for https keys, SNI
     * plus TLS handshake, all bounded by connect_timeout.
     *
     * Must be owned by a shared_ptr; a build in flight keeps it alive.
     */
    class TcpConnectionBuilder
        : public ConnectionBuilder,
          public std::enable_shared_from_this<TcpConnectionBuilder> {
       public:
        /**
         * @brief Constructs a builder.
         * @param ex Executor the connect coroutines run on.
         * @param cfg Timeout and certificate verification settings.
         */
        explicit TcpConnectionBuilder(boost::asio::any_io_executor ex,
                                      TcpBuilderConfiguration cfg = {});

        void async_build(RequestKey const& key, BuildHandler handler) override;

        /** @brief Context used for https connections. */
        boost::asio::ssl::context& ssl_context() noexcept { return m_ssl_ctx; }

       private:
        boost::asio::awaitable<Result<ConnectionPtr>> connect(RequestKey key);

        boost::asio::any_io_executor m_ex;
        TcpBuilderConfiguration m_cfg;
        boost::asio::ssl::context m_ssl_ctx;
    };

}  // namespace httpool
