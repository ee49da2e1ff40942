#ifndef S3_CLI_CONFIG_HPP
#define S3_CLI_CONFIG_HPP

// stdlib includes
#include <chrono>
#include <cstdint>
#include <string>

// local includes
#include "http_client.hpp"
#include "s3_request_signer.hpp"
#include "s3_transfer_types.hpp"
#include "s3_transfer_util.hpp"

namespace s3_cli::io::s3_transfer
{

    struct client_config
    {
        client_config()
            : endpoint{"https://s3.amazonaws.com"}
            , region{"us-east-1"}
            , debug{false}
        {}

        std::string         endpoint;
        std::string         region;
        credentials         keys;
        std::string         bucket_name;
        http_client_options http;
        bool                debug;
    };

    struct transfer_config
    {
        transfer_config()
            : part_size{constants::DEFAULT_PART_SIZE}
            , max_parallel_parts{constants::DEFAULT_MAX_PARALLEL_PARTS}
            , multipart_threshold{constants::DEFAULT_MULTIPART_THRESHOLD}
            , resume_directory{constants::DEFAULT_RESUME_DIRECTORY}
            , resume_enabled{true}
        {}

        uint64_t     part_size;
        int          max_parallel_parts;
        uint64_t     multipart_threshold;
        retry_policy retry;
        std::string  resume_directory;
        bool         resume_enabled;
    };

    // Overlays S3_ENDPOINT, AWS_REGION / AWS_DEFAULT_REGION,
    // AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN and
    // S3_BUCKET_NAME onto _config. Unset variables leave values untouched.
    void apply_environment(client_config& _config);

    // Reads the access key from the first line and the secret key from the
    // second. Throws configuration_error.
    void read_keyfile(const std::string& _path, credentials& _credentials);

    // Reads a JSON settings file such as
    //   { "hostname": "https://s3.example.com", "bucket_name": "b",
    //     "keyfile": "/etc/s3.keypair", "thread_count": 4 }
    // Recognized members are hostname, region, bucket_name, keyfile,
    // thread_count, part_size, resume_directory and debug_flag; absent ones
    // leave values untouched. Throws configuration_error.
    void read_config_file(const std::string& _path,
                          client_config& _client_config,
                          transfer_config& _transfer_config);

    // "8388608", "8M", "8MiB", "512k", "1G". Throws configuration_error on
    // malformed or out of range values.
    auto parse_size(const std::string& _value) -> uint64_t;

    // Throws configuration_error.
    void validate(const client_config& _config);
    void validate(const transfer_config& _config);

    // Fills a request with the transfer settings.
    auto make_transfer_request(const transfer_config& _config,
                               transfer_direction _direction,
                               const std::string& _bucket,
                               const std::string& _key,
                               const std::string& _local_path) -> transfer_request;

} // s3_cli::io::s3_transfer

#endif // S3_CLI_CONFIG_HPP
