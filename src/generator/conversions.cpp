#include "conversions.hpp"
#include "layout.hpp"
#include <algorithm>

namespace shortid {

bytes16 short_96_to_128(const bytes12 &id, std::uint64_t epoch, std::uint8_t machine_hi)
{
    const std::uint64_t coarse = layout::decode(id, layout::short_96::time);
    const std::uint64_t t = ((coarse + (epoch >> coarse_shift)) << coarse_shift) + gregorian_offset;
    const std::uint64_t machine = layout::decode(id, layout::short_96::machine_id);

    bytes16 result{};
    layout::encode(result, layout::short_128::time_low, t);
    layout::encode(result, layout::short_128::time_mid, t >> 32);
    layout::encode(result, layout::short_128::version, 1);
    layout::encode(result, layout::short_128::time_high, t >> 48);
    layout::encode(result, layout::short_128::variant, 0b10);
    layout::encode(result, layout::short_128::clock_sequence, layout::decode(id, layout::short_96::sequence));
    layout::encode(result, layout::short_128::worker_id, layout::decode(id, layout::short_96::worker_id));
    layout::encode(result, layout::short_128::machine_id, (std::uint64_t{machine_hi} << 24) | machine);
    return result;
}


bytes12 short_64_to_96(const bytes8 &id, const discriminator<3> &machine)
{
    bytes12 result{};
    layout::encode(result, layout::short_96::time, layout::decode(id, layout::short_64::time));
    layout::encode(result, layout::short_96::sequence, layout::decode(id, layout::short_64::sequence));
    layout::encode(result, layout::short_96::worker_id, layout::decode(id, layout::short_64::worker_id));
    layout::encode(result, layout::short_96::machine_id, layout::to_uint(machine));
    return result;
}


bytes16 short_64_to_128(const bytes8 &id, std::uint64_t epoch, const discriminator<4> &machine)
{
    const bytes12 widened = short_64_to_96(id, {machine[1], machine[2], machine[3]});
    return short_96_to_128(widened, epoch, machine[0]);
}


uuid_fields parse_uuid_v1(const bytes16 &id)
{
    using namespace layout::uuid_v1;

    uuid_fields result{};
    result.timestamp = (layout::decode(id, time_high) << 48) | (layout::decode(id, time_mid) << 32) |
                       layout::decode(id, time_low);
    result.clock_sequence = static_cast<std::uint16_t>(layout::decode(id, clock_sequence));
    result.version = static_cast<std::uint8_t>(layout::decode(id, version));
    result.variant = static_cast<std::uint8_t>(layout::decode(id, variant));
    std::copy(id.begin() + 10, id.end(), result.node.begin());
    return result;
}

} // namespace shortid
