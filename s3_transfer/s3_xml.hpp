#ifndef S3_CLI_S3_XML_HPP
#define S3_CLI_S3_XML_HPP

// stdlib includes
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace s3_cli::io::s3_transfer
{

    struct s3_error_details
    {
        std::string code;
        std::string message;
        std::string resource;
        std::string request_id;
    };

    struct object_summary
    {
        std::string key;
        uint64_t    size{0};
        std::string last_modified;
        std::string etag;
    };

    struct list_objects_page
    {
        std::vector<object_summary> objects;
        bool                        is_truncated{false};
        std::string                 next_continuation_token;
    };

    // Parses an <Error> document. Returns nothing when the body is not one.
    auto parse_error(const std::string& _body) -> std::optional<s3_error_details>;

    // <InitiateMultipartUploadResult><UploadId>
    auto parse_upload_id(const std::string& _body) -> std::optional<std::string>;

    // <ListBucketResult> from ListObjectsV2
    auto parse_list_objects(const std::string& _body) -> std::optional<list_objects_page>;

    // (part number, etag) pairs must already be in ascending part number order.
    auto build_complete_multipart_upload_xml(const std::vector<std::pair<int, std::string>>& _parts) -> std::string;

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_XML_HPP
