#include "http_client.hpp"
#include "s3_transfer_util.hpp"

#include <boost/algorithm/string.hpp>

namespace s3_cli::io::s3_transfer
{

    void http_request::set_header(const std::string& _name, const std::string& _value)
    {
        headers[boost::algorithm::to_lower_copy(_name)] = _value;
    }

    auto http_request::host_header() const -> std::string
    {
        const bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
        return default_port ? host : host + ":" + std::to_string(port);
    }

    auto http_request::target() const -> std::string
    {
        std::string target = path.empty() ? "/" : path;
        bool first = true;
        for (const auto& [name, value] : query) {
            target += first ? "?" : "&";
            target += uri_encode(name) + "=" + uri_encode(value);
            first = false;
        }
        return target;
    }

    auto http_response::header(const std::string& _name) const -> std::string
    {
        auto iter = headers.find(boost::algorithm::to_lower_copy(_name));
        return iter == headers.end() ? std::string{} : iter->second;
    }

} // s3_cli::io::s3_transfer
