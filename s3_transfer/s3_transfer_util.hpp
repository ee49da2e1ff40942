#ifndef S3_CLI_S3_TRANSFER_UTIL_HPP
#define S3_CLI_S3_TRANSFER_UTIL_HPP

// stdlib includes
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

// local includes
#include "s3_transfer_types.hpp"

namespace s3_cli::io::s3_transfer
{

    struct constants
    {
        static constexpr uint64_t MEBIBYTE{1024 * 1024};
        static constexpr uint64_t MINIMUM_PART_SIZE{5 * MEBIBYTE};
        static constexpr uint64_t MAXIMUM_PART_SIZE{5 * 1024 * MEBIBYTE};
        static constexpr uint64_t MAXIMUM_SINGLE_PART_SIZE{5 * 1024 * MEBIBYTE};
        static constexpr uint64_t MAXIMUM_OBJECT_SIZE{5 * 1024 * 1024 * MEBIBYTE};
        static constexpr int      MAXIMUM_NUMBER_OF_PARTS{10000};
        static constexpr uint64_t DEFAULT_PART_SIZE{8 * MEBIBYTE};
        static constexpr uint64_t DEFAULT_MULTIPART_THRESHOLD{8 * MEBIBYTE};
        static constexpr int      DEFAULT_MAX_PARALLEL_PARTS{8};

        inline static const std::string UNSIGNED_PAYLOAD{"UNSIGNED-PAYLOAD"};
        inline static const std::string EMPTY_PAYLOAD_SHA256{
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"};
        inline static const std::string DEFAULT_RESUME_DIRECTORY{"/tmp/s3_cli-resume"};
    };

    // Delay before the next attempt, given the number of attempts already made.
    // base * multiplier^(attempts - 1), capped at max_delay, plus a random jitter
    // drawn from [jitter_min, jitter_max] so that workers failing together do not
    // retry in lockstep.
    auto compute_backoff_delay(const retry_policy& _policy, int _attempts_made) -> std::chrono::milliseconds;

    void s3_sleep(std::chrono::milliseconds _delay);

    // ISO8601 basic format used by SigV4, "20130524T000000Z"
    auto format_amz_date(std::time_t _t) -> std::string;

    auto to_hex(const unsigned char* _data, std::size_t _size) -> std::string;

    auto base64_encode(const unsigned char* _data, std::size_t _size) -> std::string;

    auto sha256_hex(const std::string& _data) -> std::string;

    // Base64 MD5 digest suitable for the Content-MD5 header.
    auto content_md5(const std::string& _data) -> std::string;

    // RFC 3986 encoding as required by SigV4. '/' is kept when _encode_slash is false.
    auto uri_encode(const std::string& _input, bool _encode_slash = true) -> std::string;

    // Accepts "s3://bucket/key" or a bare key and returns the key part.
    auto strip_s3_url(const std::string& _path, const std::string& _bucket) -> std::string;

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_TRANSFER_UTIL_HPP
