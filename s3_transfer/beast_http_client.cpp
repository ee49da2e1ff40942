#include "beast_http_client.hpp"
#include "log.hpp"

// stdlib includes
#include <limits>
#include <optional>
#include <utility>

// boost includes
#include <boost/algorithm/string.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>

// other includes
#include <fmt/format.h>
#include <openssl/err.h>

namespace s3_cli::io::s3_transfer
{

    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;
    namespace ssl   = asio::ssl;
    using tcp       = asio::ip::tcp;

    class beast_http_client::connection
    {
    public:

        connection(const http_request& _request, ssl::context& _ssl_context)
            : key{pool_key(_request)}
        {
            if (_request.scheme == "https") {
                secure_.emplace(ioc_, _ssl_context);
            } else {
                plain_.emplace(ioc_);
            }
        }

        void open(const http_request& _request, const http_client_options& _options)
        {
            tcp::resolver resolver{ioc_};
            tcp::resolver::results_type endpoints;

            run([&resolver, &endpoints, &_request](auto _handler) {
                resolver.async_resolve(_request.host, std::to_string(_request.port),
                    [&endpoints, _handler](boost::system::error_code _ec, tcp::resolver::results_type _results) mutable {
                        endpoints = _results;
                        _handler(_ec);
                    });
            });

            lowest_layer().expires_after(_options.connect_timeout);
            run([this, &endpoints](auto _handler) {
                lowest_layer().async_connect(endpoints, _handler);
            });

            if (secure_) {
                if (!SSL_set_tlsext_host_name(secure_->native_handle(), _request.host.c_str())) {
                    throw boost::system::system_error{
                        boost::system::error_code{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()}};
                }

                if (_options.verify_ssl) {
                    secure_->set_verify_callback(ssl::host_name_verification(_request.host));
                }

                lowest_layer().expires_after(_options.connect_timeout);
                run([this](auto _handler) {
                    secure_->async_handshake(ssl::stream_base::client, _handler);
                });
            }
        }

        auto exchange(http::request<http::string_body>& _request,
                      bool _head_request,
                      std::chrono::milliseconds _timeout) -> http::response<http::string_body>
        {
            lowest_layer().expires_after(_timeout);
            run([this, &_request](auto _handler) {
                if (secure_) {
                    http::async_write(*secure_, _request, _handler);
                } else {
                    http::async_write(*plain_, _request, _handler);
                }
            });

            http::response_parser<http::string_body> parser;
            parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
            parser.skip(_head_request);

            lowest_layer().expires_after(_timeout);
            run([this, &parser](auto _handler) {
                if (secure_) {
                    http::async_read(*secure_, buffer_, parser, _handler);
                } else {
                    http::async_read(*plain_, buffer_, parser, _handler);
                }
            });

            return parser.release();
        }

        const std::string key;

    private:

        auto lowest_layer() -> beast::tcp_stream&
        {
            return secure_ ? beast::get_lowest_layer(*secure_) : *plain_;
        }

        // Runs one asynchronous operation to completion on this connection's
        // io_context and turns a failure into an exception.
        template <typename Initiate>
        void run(Initiate&& _initiate)
        {
            boost::system::error_code result;
            _initiate([&result](boost::system::error_code _ec, auto&&...) { result = _ec; });
            ioc_.restart();
            ioc_.run();
            if (result) {
                throw boost::system::system_error{result};
            }
        }

        asio::io_context                                  ioc_;
        std::optional<beast::tcp_stream>                  plain_;
        std::optional<beast::ssl_stream<beast::tcp_stream>> secure_;
        beast::flat_buffer                                buffer_;
    };

    beast_http_client::beast_http_client(const http_client_options& _options)
        : options_{_options}
        , ssl_context_{ssl::context::tls_client}
    {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(options_.verify_ssl ? ssl::verify_peer : ssl::verify_none);
    }

    beast_http_client::~beast_http_client()
    {
        close();
    }

    void beast_http_client::close()
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_connections_.clear();
    }

    auto beast_http_client::pool_key(const http_request& _request) -> std::string
    {
        return fmt::format("{}://{}:{}", _request.scheme, _request.host, _request.port);
    }

    auto beast_http_client::connect(const http_request& _request) -> std::unique_ptr<connection>
    {
        auto fresh = std::make_unique<connection>(_request, ssl_context_);
        fresh->open(_request, options_);
        return fresh;
    }

    auto beast_http_client::acquire(const http_request& _request, bool& _reused) -> std::unique_ptr<connection>
    {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            auto& idle = idle_connections_[pool_key(_request)];
            if (!idle.empty()) {
                auto pooled = std::move(idle.back());
                idle.pop_back();
                _reused = true;
                return pooled;
            }
        }

        _reused = false;
        return connect(_request);
    }

    void beast_http_client::release(std::unique_ptr<connection> _connection)
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        auto& idle = idle_connections_[_connection->key];
        if (idle.size() < options_.max_idle_connections_per_host) {
            idle.push_back(std::move(_connection));
        }
    }

    auto beast_http_client::perform(const http_request& _request) -> http_response
    {
        const auto verb = http::string_to_verb(_request.method);
        if (http::verb::unknown == verb) {
            throw boost::system::system_error{
                boost::system::errc::make_error_code(boost::system::errc::invalid_argument),
                "unsupported HTTP method " + _request.method};
        }

        http::request<http::string_body> request{verb, _request.target(), 11};
        for (const auto& [name, value] : _request.headers) {
            request.set(name, value);
        }
        request.body() = _request.body;
        request.prepare_payload();

        const bool head_request = http::verb::head == verb;

        bool reused = false;
        auto conn = acquire(_request, reused);

        http::response<http::string_body> response;
        try {
            response = conn->exchange(request, head_request, options_.request_timeout);
        }
        catch (const boost::system::system_error& e) {
            if (!reused) {
                throw;
            }

            // The server may have closed an idle pooled connection; one fresh
            // connection is tried before the error reaches the retry policy.
            log::debug(__FILE__, __LINE__, __FUNCTION__,
                    fmt::format("pooled connection to {} failed [{}], reconnecting", conn->key, e.what()));
            conn = connect(_request);
            response = conn->exchange(request, head_request, options_.request_timeout);
        }

        http_response result;
        result.status = response.result_int();
        for (const auto& field : response) {
            result.headers[boost::algorithm::to_lower_copy(std::string{field.name_string()})] =
                std::string{field.value()};
        }
        const bool keep_alive = response.keep_alive();
        result.body = std::move(response.body());

        if (keep_alive) {
            release(std::move(conn));
        }

        return result;
    }

} // s3_cli::io::s3_transfer
