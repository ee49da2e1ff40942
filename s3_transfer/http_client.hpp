#ifndef S3_CLI_HTTP_CLIENT_HPP
#define S3_CLI_HTTP_CLIENT_HPP

// stdlib includes
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace s3_cli::io::s3_transfer
{

    // Header names are stored lower case so that canonicalization is a plain
    // walk over the map.
    using header_map = std::map<std::string, std::string>;

    struct http_request
    {
        http_request()
            : method{"GET"}
            , scheme{"https"}
            , port{443}
            , path{"/"}
        {}

        std::string method;
        std::string scheme;
        std::string host;
        uint16_t    port;
        std::string path;                          // already URI encoded
        std::map<std::string, std::string> query;  // raw names and values
        header_map  headers;
        std::string body;

        void set_header(const std::string& _name, const std::string& _value);

        // "host" or "host:port" when the port is not the scheme default
        auto host_header() const -> std::string;

        // encoded path plus encoded, sorted query
        auto target() const -> std::string;
    };

    struct http_response
    {
        http_response()
            : status{0}
        {}

        unsigned int status;
        header_map   headers;
        std::string  body;

        // empty string when the header is absent
        auto header(const std::string& _name) const -> std::string;
    };

    // Executes one HTTP exchange. Implementations throw
    // boost::system::system_error for connection level failures and timeouts;
    // any HTTP status, including errors, is returned as a response.
    // Implementations must be safe for concurrent use.
    class http_client
    {
    public:
        virtual ~http_client() = default;

        virtual auto perform(const http_request& _request) -> http_response = 0;
    };

    struct http_client_options
    {
        http_client_options()
            : connect_timeout{std::chrono::seconds{10}}
            , request_timeout{std::chrono::seconds{120}}
            , verify_ssl{true}
            , max_idle_connections_per_host{16}
        {}

        std::chrono::milliseconds connect_timeout;
        std::chrono::milliseconds request_timeout;
        bool                      verify_ssl;
        std::size_t               max_idle_connections_per_host;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_HTTP_CLIENT_HPP
