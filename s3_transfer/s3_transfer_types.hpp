#ifndef S3_CLI_S3_TRANSFER_TYPES_HPP
#define S3_CLI_S3_TRANSFER_TYPES_HPP

// stdlib includes
#include <cstdint>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace s3_cli::io::s3_transfer
{

    enum class transfer_direction
    {
        upload,
        download
    };

    enum class error_kind
    {
        none,
        configuration_error,
        transient_network_error,
        authentication_error,
        server_rejection_error,
        partial_transfer_error,
        local_io_error,
        cancelled
    };

    enum class part_state
    {
        pending,
        in_flight,
        retry_scheduled,
        completed,
        failed
    };

    enum class session_state
    {
        running,
        completed,
        failed,
        cancelled
    };

    auto to_string(transfer_direction _direction) -> const char*;
    auto to_string(error_kind _kind) -> const char*;
    auto to_string(part_state _state) -> const char*;
    auto to_string(session_state _state) -> const char*;

    struct retry_policy
    {
        retry_policy()
            : max_attempts{5}
            , base_delay{std::chrono::milliseconds{200}}
            , backoff_multiplier{2.0}
            , max_delay{std::chrono::milliseconds{20000}}
            , jitter_min{std::chrono::milliseconds{0}}
            , jitter_max{std::chrono::milliseconds{1000}}
            , retryable_kinds{error_kind::transient_network_error}
        {}

        int                       max_attempts;
        std::chrono::milliseconds base_delay;
        double                    backoff_multiplier;
        std::chrono::milliseconds max_delay;
        std::chrono::milliseconds jitter_min;
        std::chrono::milliseconds jitter_max;
        std::set<error_kind>      retryable_kinds;

        bool is_retryable(error_kind _kind) const
        {
            return retryable_kinds.count(_kind) > 0;
        }
    };

    struct transfer_request
    {
        transfer_request()
            : direction{transfer_direction::upload}
            , part_size{8 * 1024 * 1024}
            , max_parallel_parts{8}
            , multipart_threshold{8 * 1024 * 1024}
            , resumable{true}
        {}

        transfer_direction          direction;
        std::string                 bucket;
        std::string                 key;
        std::string                 local_path;
        std::optional<uint64_t>     object_size;       // discovered when not given
        uint64_t                    part_size;
        int                         max_parallel_parts;
        uint64_t                    multipart_threshold;
        std::optional<retry_policy> retry_override;
        bool                        resumable;
    };

    struct part
    {
        part(int _index, uint64_t _start, uint64_t _end)
            : index{_index}
            , start{_start}
            , end{_end}
            , state{part_state::pending}
            , attempts{0}
            , bytes_received{0}
            , last_error{error_kind::none}
        {}

        auto size() const -> uint64_t { return end - start; }

        int         index;          // 1-based
        uint64_t    start;
        uint64_t    end;            // exclusive
        part_state  state;
        int         attempts;
        std::string etag;           // upload
        uint64_t    bytes_received; // download
        error_kind  last_error;
        std::string last_error_message;
    };

    struct part_error_summary
    {
        int         index;
        int         attempts;
        error_kind  kind;
        std::string message;
    };

    struct transfer_result
    {
        transfer_result()
            : state{session_state::failed}
            , bytes_transferred{0}
            , duration{0}
            , parts_completed{0}
            , parts_total{0}
            , parts_resumed{0}
            , multipart{false}
            , error{error_kind::none}
        {}

        session_state                   state;
        uint64_t                        bytes_transferred;
        std::chrono::milliseconds       duration;
        int                             parts_completed;
        int                             parts_total;
        int                             parts_resumed;
        bool                            multipart;
        error_kind                      error;
        std::string                     error_message;
        std::vector<part_error_summary> part_errors;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_TRANSFER_TYPES_HPP
