#include "s3_client.hpp"
#include "s3_transfer_error.hpp"
#include "s3_transfer_util.hpp"
#include "log.hpp"

// stdlib includes
#include <algorithm>

// boost includes
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

// other includes
#include <fmt/format.h>

namespace s3_cli::io::s3_transfer
{

    namespace
    {
        const uint64_t LIST_OBJECTS_PAGE_SIZE{1000};

        auto content_length(const http_response& _response) -> std::optional<uint64_t>
        {
            const auto value = _response.header("content-length");
            if (value.empty()) {
                return std::nullopt;
            }
            try {
                return boost::lexical_cast<uint64_t>(boost::algorithm::trim_copy(value));
            }
            catch (const boost::bad_lexical_cast&) {
                return std::nullopt;
            }
        }
    } // namespace

    auto parse_endpoint(const std::string& _url) -> endpoint
    {
        endpoint result{"https", "", 443};

        std::string rest = boost::algorithm::trim_copy(_url);
        const auto scheme_end = rest.find("://");
        if (scheme_end != std::string::npos) {
            result.scheme = boost::algorithm::to_lower_copy(rest.substr(0, scheme_end));
            rest = rest.substr(scheme_end + 3);
        }

        if ("https" == result.scheme) {
            result.port = 443;
        } else if ("http" == result.scheme) {
            result.port = 80;
        } else {
            throw configuration_error{fmt::format("unsupported endpoint scheme [{}] in [{}]", result.scheme, _url)};
        }

        // drop any path component
        if (auto slash = rest.find('/'); slash != std::string::npos) {
            rest = rest.substr(0, slash);
        }

        if (auto colon = rest.rfind(':'); colon != std::string::npos) {
            const auto port = rest.substr(colon + 1);
            try {
                const auto value = boost::lexical_cast<unsigned int>(port);
                if (0 == value || value > 65535) {
                    throw boost::bad_lexical_cast{};
                }
                result.port = static_cast<uint16_t>(value);
            }
            catch (const boost::bad_lexical_cast&) {
                throw configuration_error{fmt::format("invalid port [{}] in endpoint [{}]", port, _url)};
            }
            rest = rest.substr(0, colon);
        }

        if (rest.empty()) {
            throw configuration_error{fmt::format("endpoint [{}] has no host", _url)};
        }

        result.host = rest;
        return result;
    }

    s3_client::s3_client(std::shared_ptr<s3_transport> _transport, endpoint _endpoint)
        : transport_{std::move(_transport)}
        , endpoint_{std::move(_endpoint)}
    {
    }

    auto s3_client::make_request(const std::string& _method,
                                 const std::string& _bucket,
                                 const std::string& _key) const -> http_request
    {
        http_request request;
        request.method = _method;
        request.scheme = endpoint_.scheme;
        request.host   = endpoint_.host;
        request.port   = endpoint_.port;
        request.path   = "/" + uri_encode(_bucket) + "/" + uri_encode(_key, false);
        return request;
    }

    auto s3_client::run(http_request _request,
                        const request_options& _options,
                        const response_validator& _validator) const -> request_outcome
    {
        // the payload hash is computed once here rather than on every signing
        if (_request.headers.count("x-amz-content-sha256") == 0) {
            _request.set_header("x-amz-content-sha256",
                    _request.body.empty() ? constants::EMPTY_PAYLOAD_SHA256 : sha256_hex(_request.body));
        }

        const auto& policy = _options.policy ? *_options.policy : transport_->default_policy();
        return transport_->execute(std::move(_request), policy, _options.observer, _options.keep_going, _validator);
    }

    auto s3_client::head_object(const std::string& _bucket,
                                const std::string& _key,
                                object_metadata& _metadata,
                                const request_options& _options) const -> request_outcome
    {
        auto outcome = run(make_request("HEAD", _bucket, _key), _options,
                [](const http_response& _response) -> std::optional<std::string> {
                    if (!content_length(_response)) {
                        return std::string{"HEAD response without a valid Content-Length"};
                    }
                    return std::nullopt;
                });

        if (outcome.ok()) {
            _metadata.size          = *content_length(outcome.response);
            _metadata.etag          = outcome.response.header("etag");
            _metadata.last_modified = outcome.response.header("last-modified");
            _metadata.content_type  = outcome.response.header("content-type");
        }

        return outcome;
    }

    auto s3_client::put_object(const std::string& _bucket,
                               const std::string& _key,
                               const std::string& _body,
                               std::string& _etag,
                               const request_options& _options) const -> request_outcome
    {
        auto request = make_request("PUT", _bucket, _key);
        request.body = _body;
        request.set_header("content-type", "application/octet-stream");
        request.set_header("content-md5", content_md5(_body));

        auto outcome = run(std::move(request), _options);
        if (outcome.ok()) {
            _etag = outcome.response.header("etag");
        }
        return outcome;
    }

    auto s3_client::get_object(const std::string& _bucket,
                               const std::string& _key,
                               std::string& _body,
                               const request_options& _options) const -> request_outcome
    {
        auto outcome = run(make_request("GET", _bucket, _key), _options,
                [](const http_response& _response) -> std::optional<std::string> {
                    const auto expected = content_length(_response);
                    if (expected && *expected != _response.body.size()) {
                        return fmt::format("truncated body: received {} of {} bytes",
                                _response.body.size(), *expected);
                    }
                    return std::nullopt;
                });

        if (outcome.ok()) {
            _body = std::move(outcome.response.body);
        }
        return outcome;
    }

    auto s3_client::get_object_range(const std::string& _bucket,
                                     const std::string& _key,
                                     uint64_t _start,
                                     uint64_t _end,
                                     const std::string& _if_match,
                                     std::string& _body,
                                     const request_options& _options) const -> request_outcome
    {
        if (_end <= _start) {
            _body.clear();
            request_outcome empty;
            return empty;
        }

        auto request = make_request("GET", _bucket, _key);
        request.set_header("range", fmt::format("bytes={}-{}", _start, _end - 1));
        if (!_if_match.empty()) {
            request.set_header("if-match", _if_match);
        }

        const uint64_t expected = _end - _start;
        auto outcome = run(std::move(request), _options,
                [expected](const http_response& _response) -> std::optional<std::string> {
                    if (_response.body.size() != expected) {
                        return fmt::format("truncated body: received {} of {} bytes",
                                _response.body.size(), expected);
                    }
                    return std::nullopt;
                });

        if (outcome.ok()) {
            _body = std::move(outcome.response.body);
        }
        return outcome;
    }

    auto s3_client::initiate_multipart_upload(const std::string& _bucket,
                                              const std::string& _key,
                                              std::string& _upload_id,
                                              const request_options& _options) const -> request_outcome
    {
        auto request = make_request("POST", _bucket, _key);
        request.query["uploads"] = "";
        request.set_header("content-type", "application/octet-stream");

        auto outcome = run(std::move(request), _options,
                [](const http_response& _response) -> std::optional<std::string> {
                    if (!parse_upload_id(_response.body)) {
                        return std::string{"InitiateMultipartUpload response carries no UploadId"};
                    }
                    return std::nullopt;
                });

        if (outcome.ok()) {
            _upload_id = *parse_upload_id(outcome.response.body);
        }
        return outcome;
    }

    auto s3_client::upload_part(const std::string& _bucket,
                                const std::string& _key,
                                const std::string& _upload_id,
                                int _part_number,
                                const std::string& _body,
                                std::string& _etag,
                                const request_options& _options) const -> request_outcome
    {
        auto request = make_request("PUT", _bucket, _key);
        request.query["partNumber"] = std::to_string(_part_number);
        request.query["uploadId"]   = _upload_id;
        request.body = _body;
        request.set_header("content-md5", content_md5(_body));

        auto outcome = run(std::move(request), _options,
                [](const http_response& _response) -> std::optional<std::string> {
                    if (_response.header("etag").empty()) {
                        return std::string{"UploadPart response carries no ETag"};
                    }
                    return std::nullopt;
                });

        if (outcome.ok()) {
            _etag = outcome.response.header("etag");
        }
        return outcome;
    }

    auto s3_client::complete_multipart_upload(const std::string& _bucket,
                                              const std::string& _key,
                                              const std::string& _upload_id,
                                              const std::vector<std::pair<int, std::string>>& _parts,
                                              const request_options& _options) const -> request_outcome
    {
        auto request = make_request("POST", _bucket, _key);
        request.query["uploadId"] = _upload_id;
        request.body = build_complete_multipart_upload_xml(_parts);
        request.set_header("content-type", "application/xml");

        // S3 may answer 200 and report the failure in the body
        return run(std::move(request), _options,
                [](const http_response& _response) -> std::optional<std::string> {
                    if (auto details = parse_error(_response.body)) {
                        return fmt::format("CompleteMultipartUpload failed: {}: {}", details->code, details->message);
                    }
                    return std::nullopt;
                });
    }

    auto s3_client::abort_multipart_upload(const std::string& _bucket,
                                           const std::string& _key,
                                           const std::string& _upload_id,
                                           const request_options& _options) const -> request_outcome
    {
        auto request = make_request("DELETE", _bucket, _key);
        request.query["uploadId"] = _upload_id;
        return run(std::move(request), _options);
    }

    auto s3_client::delete_object(const std::string& _bucket,
                                  const std::string& _key,
                                  const request_options& _options) const -> request_outcome
    {
        return run(make_request("DELETE", _bucket, _key), _options);
    }

    auto s3_client::list_objects(const std::string& _bucket,
                                 const std::string& _prefix,
                                 const std::string& _start_after,
                                 uint64_t _max_keys,
                                 std::vector<object_summary>& _objects,
                                 const request_options& _options) const -> request_outcome
    {
        std::string continuation_token;
        request_outcome outcome;

        while (_objects.size() < _max_keys) {

            auto request = make_request("GET", _bucket, "");
            request.query["list-type"] = "2";
            request.query["max-keys"]  = std::to_string(std::min<uint64_t>(LIST_OBJECTS_PAGE_SIZE, _max_keys - _objects.size()));
            if (!_prefix.empty()) {
                request.query["prefix"] = _prefix;
            }
            if (!continuation_token.empty()) {
                request.query["continuation-token"] = continuation_token;
            } else if (!_start_after.empty()) {
                request.query["start-after"] = _start_after;
            }

            outcome = run(std::move(request), _options,
                    [](const http_response& _response) -> std::optional<std::string> {
                        if (!parse_list_objects(_response.body)) {
                            return std::string{"malformed ListBucketResult"};
                        }
                        return std::nullopt;
                    });

            if (!outcome.ok()) {
                return outcome;
            }

            auto page = *parse_list_objects(outcome.response.body);
            log::debug(__FILE__, __LINE__, __FUNCTION__,
                    fmt::format("listed {} objects in {} (truncated={})", page.objects.size(), _bucket, page.is_truncated));

            for (auto& object : page.objects) {
                if (_objects.size() >= _max_keys) {
                    break;
                }
                _objects.push_back(std::move(object));
            }

            if (!page.is_truncated || page.next_continuation_token.empty()) {
                break;
            }
            continuation_token = page.next_continuation_token;
        }

        return outcome;
    }

} // s3_cli::io::s3_transfer
