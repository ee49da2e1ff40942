#include "s3_request_signer.hpp"
#include "s3_transfer_util.hpp"

// stdlib includes
#include <sstream>
#include <utility>

// boost includes
#include <boost/algorithm/string.hpp>

// system includes
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace s3_cli::io::s3_transfer
{

    namespace
    {
        auto hmac_sha256(const std::string& _key, const std::string& _data) -> std::string
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int  hash_length = 0;

            HMAC(EVP_sha256(), _key.data(), static_cast<int>(_key.size()),
                 reinterpret_cast<const unsigned char*>(_data.data()), _data.size(),
                 hash, &hash_length);

            return std::string(reinterpret_cast<const char*>(hash), hash_length);
        }
    } // anonymous namespace

    auto canonical_query_string(const http_request& _request) -> std::string
    {
        // std::map keeps the raw names sorted; encoding does not change the
        // relative order of the unreserved characters S3 uses in names.
        std::string result;
        for (const auto& [name, value] : _request.query) {
            if (!result.empty()) {
                result += '&';
            }
            result += uri_encode(name) + "=" + uri_encode(value);
        }
        return result;
    }

    request_signer::request_signer(credentials _credentials,
                                   std::string _region,
                                   std::string _service)
        : credentials_{std::move(_credentials)}
        , region_{std::move(_region)}
        , service_{std::move(_service)}
    {
    }

    void request_signer::sign(http_request& _request) const
    {
        sign(_request, std::time(nullptr));
    }

    void request_signer::sign(http_request& _request, std::time_t _now) const
    {
        const auto amz_date = format_amz_date(_now);
        const auto date     = amz_date.substr(0, 8);

        _request.headers.erase("authorization");
        _request.set_header("host", _request.host_header());
        _request.set_header("x-amz-date", amz_date);

        if (_request.headers.count("x-amz-content-sha256") == 0) {
            _request.set_header("x-amz-content-sha256", _request.body.empty()
                    ? constants::EMPTY_PAYLOAD_SHA256
                    : sha256_hex(_request.body));
        }

        if (!credentials_.session_token.empty()) {
            _request.set_header("x-amz-security-token", credentials_.session_token);
        }

        std::string signed_headers;
        for (const auto& header : _request.headers) {
            if (!signed_headers.empty()) {
                signed_headers += ';';
            }
            signed_headers += header.first;
        }

        const auto canonical = canonical_request(_request, signed_headers,
                _request.headers["x-amz-content-sha256"]);

        const auto to_sign = string_to_sign(amz_date, canonical);

        std::ostringstream authorization;
        authorization << "AWS4-HMAC-SHA256 "
                      << "Credential=" << credentials_.access_key << "/" << credential_scope(date) << ", "
                      << "SignedHeaders=" << signed_headers << ", "
                      << "Signature=" << signature(date, to_sign);

        _request.set_header("authorization", authorization.str());
    }

    auto request_signer::canonical_request(const http_request& _request,
                                           const std::string& _signed_headers,
                                           const std::string& _payload_hash) const -> std::string
    {
        std::ostringstream canonical;

        canonical << _request.method << "\n";
        canonical << (_request.path.empty() ? "/" : _request.path) << "\n";
        canonical << canonical_query_string(_request) << "\n";

        for (const auto& [name, value] : _request.headers) {
            if (name == "authorization") {
                continue;
            }
            canonical << name << ":" << boost::algorithm::trim_copy(value) << "\n";
        }
        canonical << "\n";

        canonical << _signed_headers << "\n";
        canonical << _payload_hash;

        return canonical.str();
    }

    auto request_signer::string_to_sign(const std::string& _amz_date,
                                        const std::string& _canonical_request) const -> std::string
    {
        std::ostringstream to_sign;
        to_sign << "AWS4-HMAC-SHA256\n";
        to_sign << _amz_date << "\n";
        to_sign << credential_scope(_amz_date.substr(0, 8)) << "\n";
        to_sign << sha256_hex(_canonical_request);
        return to_sign.str();
    }

    auto request_signer::signature(const std::string& _date, const std::string& _string_to_sign) const -> std::string
    {
        const auto k_date    = hmac_sha256("AWS4" + credentials_.secret_access_key, _date);
        const auto k_region  = hmac_sha256(k_date, region_);
        const auto k_service = hmac_sha256(k_region, service_);
        const auto k_signing = hmac_sha256(k_service, "aws4_request");

        const auto raw = hmac_sha256(k_signing, _string_to_sign);
        return to_hex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    }

    auto request_signer::credential_scope(const std::string& _date) const -> std::string
    {
        return _date + "/" + region_ + "/" + service_ + "/aws4_request";
    }

} // s3_cli::io::s3_transfer
