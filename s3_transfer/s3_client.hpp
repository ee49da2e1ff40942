#ifndef S3_CLI_S3_CLIENT_HPP
#define S3_CLI_S3_CLIENT_HPP

// stdlib includes
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// local includes
#include "s3_transport.hpp"
#include "s3_xml.hpp"

namespace s3_cli::io::s3_transfer
{

    struct endpoint
    {
        std::string scheme;
        std::string host;
        uint16_t    port;
    };

    // Accepts "https://host[:port]", "http://host[:port]" or a bare host
    // (https assumed). Throws configuration_error on anything else.
    auto parse_endpoint(const std::string& _url) -> endpoint;

    struct object_metadata
    {
        uint64_t    size{0};
        std::string etag;
        std::string last_modified;
        std::string content_type;
    };

    // Per call retry settings. The transport's default policy is used when
    // no policy is given.
    struct request_options
    {
        std::optional<retry_policy> policy;
        attempt_observer            observer;
        continue_predicate          keep_going;
    };

    /// The S3 operations used by the transfer engine and the command line
    /// front end, expressed as signed requests executed by an s3_transport.
    ///
    /// Addressing is path style ("/bucket/key"). Every operation returns the
    /// request_outcome of its last attempt; parsed results are written to the
    /// output parameter only on success.
    class s3_client
    {
    public:

        s3_client(std::shared_ptr<s3_transport> _transport, endpoint _endpoint);

        auto head_object(const std::string& _bucket,
                         const std::string& _key,
                         object_metadata& _metadata,
                         const request_options& _options = {}) const -> request_outcome;

        auto put_object(const std::string& _bucket,
                        const std::string& _key,
                        const std::string& _body,
                        std::string& _etag,
                        const request_options& _options = {}) const -> request_outcome;

        // Whole object. A body shorter than the advertised Content-Length is
        // retried.
        auto get_object(const std::string& _bucket,
                        const std::string& _key,
                        std::string& _body,
                        const request_options& _options = {}) const -> request_outcome;

        // Bytes [_start, _end). When _if_match is not empty the request is
        // conditional on the object's ETag, and a changed object yields a
        // fatal 412. A body of the wrong length is retried.
        auto get_object_range(const std::string& _bucket,
                              const std::string& _key,
                              uint64_t _start,
                              uint64_t _end,
                              const std::string& _if_match,
                              std::string& _body,
                              const request_options& _options = {}) const -> request_outcome;

        auto initiate_multipart_upload(const std::string& _bucket,
                                       const std::string& _key,
                                       std::string& _upload_id,
                                       const request_options& _options = {}) const -> request_outcome;

        auto upload_part(const std::string& _bucket,
                         const std::string& _key,
                         const std::string& _upload_id,
                         int _part_number,
                         const std::string& _body,
                         std::string& _etag,
                         const request_options& _options = {}) const -> request_outcome;

        // _parts must be in ascending part number order.
        auto complete_multipart_upload(const std::string& _bucket,
                                       const std::string& _key,
                                       const std::string& _upload_id,
                                       const std::vector<std::pair<int, std::string>>& _parts,
                                       const request_options& _options = {}) const -> request_outcome;

        auto abort_multipart_upload(const std::string& _bucket,
                                    const std::string& _key,
                                    const std::string& _upload_id,
                                    const request_options& _options = {}) const -> request_outcome;

        auto delete_object(const std::string& _bucket,
                           const std::string& _key,
                           const request_options& _options = {}) const -> request_outcome;

        // ListObjectsV2, following continuation tokens until _max_keys
        // objects were collected or the listing ends.
        auto list_objects(const std::string& _bucket,
                          const std::string& _prefix,
                          const std::string& _start_after,
                          uint64_t _max_keys,
                          std::vector<object_summary>& _objects,
                          const request_options& _options = {}) const -> request_outcome;

        auto transport() const -> const s3_transport& { return *transport_; }

    private:

        auto make_request(const std::string& _method,
                          const std::string& _bucket,
                          const std::string& _key) const -> http_request;

        auto run(http_request _request,
                 const request_options& _options,
                 const response_validator& _validator = {}) const -> request_outcome;

        std::shared_ptr<s3_transport> transport_;
        endpoint                      endpoint_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_CLIENT_HPP
