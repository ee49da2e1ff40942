#ifndef S3_CLI_S3_REQUEST_SIGNER_HPP
#define S3_CLI_S3_REQUEST_SIGNER_HPP

// stdlib includes
#include <ctime>
#include <string>

// local includes
#include "http_client.hpp"

namespace s3_cli::io::s3_transfer
{

    struct credentials
    {
        std::string access_key;
        std::string secret_access_key;
        std::string session_token;     // optional
    };

    /// Signs requests with AWS Signature Version 4.
    ///
    /// The request's path must already be URI encoded. Every header present in
    /// the request at signing time (except Authorization) is signed, so callers
    /// add Range, Content-MD5, If-Match and friends before calling sign().
    ///
    /// Instances are immutable after construction and safe to share between threads.
    class request_signer
    {
    public:

        request_signer(credentials _credentials,
                       std::string _region,
                       std::string _service = "s3");

        // Adds host, x-amz-date, x-amz-content-sha256, x-amz-security-token and
        // Authorization headers. Re-signing an already signed request replaces them.
        void sign(http_request& _request) const;
        void sign(http_request& _request, std::time_t _now) const;

        auto canonical_request(const http_request& _request,
                               const std::string& _signed_headers,
                               const std::string& _payload_hash) const -> std::string;

        auto string_to_sign(const std::string& _amz_date,
                            const std::string& _canonical_request) const -> std::string;

        auto signature(const std::string& _date, const std::string& _string_to_sign) const -> std::string;

    private:

        auto credential_scope(const std::string& _date) const -> std::string;

        credentials credentials_;
        std::string region_;
        std::string service_;
    };

    // Canonical query string: names and values encoded, sorted by name,
    // parameters without a value rendered as "name=".
    auto canonical_query_string(const http_request& _request) -> std::string;

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_REQUEST_SIGNER_HPP
