#ifndef S3_CLI_PART_PLAN_HPP
#define S3_CLI_PART_PLAN_HPP

// stdlib includes
#include <cstdint>
#include <vector>

// local includes
#include "s3_transfer_types.hpp"

namespace s3_cli::io::s3_transfer
{

    struct part_plan
    {
        uint64_t          object_size;
        uint64_t          part_size;
        std::vector<part> parts;
    };

    // Part size actually used for an object. Upload parts are raised to the
    // 5 MiB protocol minimum; for any direction the size is raised (in whole
    // MiB) until the object fits in 10,000 parts.
    auto effective_part_size(uint64_t _object_size,
                             uint64_t _requested_part_size,
                             transfer_direction _direction) -> uint64_t;

    // Splits [0, _object_size) into consecutive parts numbered from 1. Every
    // part has the effective part size except the last, which holds the
    // remainder. An empty object yields a single empty part.
    auto make_part_plan(uint64_t _object_size,
                        uint64_t _requested_part_size,
                        transfer_direction _direction) -> part_plan;

    // One part covering the whole object, for the single request path.
    auto make_single_part_plan(uint64_t _object_size) -> part_plan;

    // Multipart is used for non-empty objects at or above the threshold.
    inline bool use_multipart(uint64_t _object_size, uint64_t _multipart_threshold)
    {
        return _object_size > 0 && _object_size >= _multipart_threshold;
    }

} // s3_cli::io::s3_transfer

#endif // S3_CLI_PART_PLAN_HPP
