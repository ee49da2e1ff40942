#include "part_plan.hpp"
#include "s3_transfer_util.hpp"

#include <algorithm>

namespace s3_cli::io::s3_transfer
{

    auto effective_part_size(uint64_t _object_size,
                             uint64_t _requested_part_size,
                             transfer_direction _direction) -> uint64_t
    {
        uint64_t part_size = std::max<uint64_t>(_requested_part_size, 1);

        if (transfer_direction::upload == _direction) {
            part_size = std::max(part_size, constants::MINIMUM_PART_SIZE);
        }

        const uint64_t max_parts = constants::MAXIMUM_NUMBER_OF_PARTS;
        if ((_object_size + part_size - 1) / part_size > max_parts) {
            const uint64_t needed = (_object_size + max_parts - 1) / max_parts;
            part_size = (needed + constants::MEBIBYTE - 1) / constants::MEBIBYTE * constants::MEBIBYTE;
        }

        return part_size;
    }

    auto make_part_plan(uint64_t _object_size,
                        uint64_t _requested_part_size,
                        transfer_direction _direction) -> part_plan
    {
        part_plan plan;
        plan.object_size = _object_size;
        plan.part_size   = effective_part_size(_object_size, _requested_part_size, _direction);

        if (0 == _object_size) {
            plan.parts.emplace_back(1, 0, 0);
            return plan;
        }

        int index = 1;
        for (uint64_t start = 0; start < _object_size; start += plan.part_size) {
            plan.parts.emplace_back(index++, start, std::min(start + plan.part_size, _object_size));
        }

        return plan;
    }

    auto make_single_part_plan(uint64_t _object_size) -> part_plan
    {
        part_plan plan;
        plan.object_size = _object_size;
        plan.part_size   = _object_size;
        plan.parts.emplace_back(1, 0, _object_size);
        return plan;
    }

} // s3_cli::io::s3_transfer
