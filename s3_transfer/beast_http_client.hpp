#ifndef S3_CLI_BEAST_HTTP_CLIENT_HPP
#define S3_CLI_BEAST_HTTP_CLIENT_HPP

// stdlib includes
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// boost includes
#include <boost/asio/ssl/context.hpp>

// local includes
#include "http_client.hpp"

namespace s3_cli::io::s3_transfer
{

    /// Blocking HTTP/1.1 client over Boost.Beast with plain TCP or TLS.
    ///
    /// Idle keep-alive connections are pooled per scheme/host/port and handed
    /// to one caller at a time, so the client can be shared by all transfer
    /// workers. Each connection owns its io_context; operations are run as
    /// asynchronous operations on that context so that the stream's expiry
    /// enforces the connect and request timeouts.
    class beast_http_client : public http_client
    {
    public:

        explicit beast_http_client(const http_client_options& _options = http_client_options{});
        ~beast_http_client() override;

        beast_http_client(const beast_http_client&) = delete;
        auto operator=(const beast_http_client&) -> beast_http_client& = delete;

        auto perform(const http_request& _request) -> http_response override;

        // Drops all idle connections.
        void close();

    private:

        class connection;

        auto acquire(const http_request& _request, bool& _reused) -> std::unique_ptr<connection>;
        void release(std::unique_ptr<connection> _connection);
        auto connect(const http_request& _request) -> std::unique_ptr<connection>;

        static auto pool_key(const http_request& _request) -> std::string;

        http_client_options      options_;
        boost::asio::ssl::context ssl_context_;

        std::mutex                                                     pool_mutex_;
        std::map<std::string, std::vector<std::unique_ptr<connection>>> idle_connections_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_BEAST_HTTP_CLIENT_HPP
