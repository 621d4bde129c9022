#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shortid::layout {

// A field inside a fixed-width identifier. Offsets count from the most
// significant bit of byte 0; values are stored big-endian.
struct bit_field {
    std::string_view name;
    std::size_t offset;
    std::size_t width;
};

// Fields are listed in byte order and must tile the identifier exactly.
template<std::size_t Bytes, std::size_t Fields>
constexpr bool tiles(const std::array<bit_field, Fields> &fields)
{
    std::size_t next = 0;
    for (const auto &f: fields) {
        if (f.offset != next || f.width == 0 || f.width > 64)
            return false;
        next += f.width;
    }
    return next == Bytes * 8;
}


// RFC 4122 version 1
namespace uuid_v1 {
inline constexpr std::size_t size = 16;
inline constexpr bit_field time_low{"time_low", 0, 32};
inline constexpr bit_field time_mid{"time_mid", 32, 16};
inline constexpr bit_field version{"version", 48, 4};
inline constexpr bit_field time_high{"time_high", 52, 12};
inline constexpr bit_field variant{"variant", 64, 2};
inline constexpr bit_field clock_sequence{"clock_sequence", 66, 14};
inline constexpr bit_field node{"node", 80, 48};
inline constexpr std::array<bit_field, 7> fields{time_low, time_mid, version, time_high, variant, clock_sequence, node};
static_assert(tiles<size>(fields));
} // namespace uuid_v1

// v1-compatible: the node field is split into worker id and machine id
namespace short_128 {
inline constexpr std::size_t size = 16;
using uuid_v1::clock_sequence;
using uuid_v1::time_high;
using uuid_v1::time_low;
using uuid_v1::time_mid;
using uuid_v1::variant;
using uuid_v1::version;
inline constexpr bit_field worker_id{"worker_id", 80, 16};
inline constexpr bit_field machine_id{"machine_id", 96, 32};
inline constexpr std::array<bit_field, 8> fields{time_low, time_mid,       version,   time_high,
                                                 variant,  clock_sequence, worker_id, machine_id};
static_assert(tiles<size>(fields));
} // namespace short_128

namespace short_96 {
inline constexpr std::size_t size = 12;
inline constexpr bit_field time{"time", 0, 42};
inline constexpr bit_field sequence{"sequence", 42, 14};
inline constexpr bit_field worker_id{"worker_id", 56, 16};
inline constexpr bit_field machine_id{"machine_id", 72, 24};
inline constexpr std::array<bit_field, 4> fields{time, sequence, worker_id, machine_id};
static_assert(tiles<size>(fields));
} // namespace short_96

namespace short_64 {
inline constexpr std::size_t size = 8;
inline constexpr bit_field time{"time", 0, 42};
inline constexpr bit_field sequence{"sequence", 42, 14};
inline constexpr bit_field worker_id{"worker_id", 56, 8};
inline constexpr std::array<bit_field, 3> fields{time, sequence, worker_id};
static_assert(tiles<size>(fields));
} // namespace short_64


constexpr std::uint64_t max_value(const bit_field &f)
{
    return f.width >= 64 ? ~std::uint64_t{0} : (std::uint64_t{1} << f.width) - 1;
}


template<std::size_t N> void check_bounds(const bit_field &f)
{
    if (f.width == 0 || f.width > 64 || f.offset + f.width > N * 8)
        throw std::out_of_range("bit field '" + std::string(f.name) + "' does not fit the identifier");
}


// Writes the low `f.width` bits of value; higher bits are discarded.
template<std::size_t N> void encode(std::array<std::uint8_t, N> &bytes, const bit_field &f, std::uint64_t value)
{
    check_bounds<N>(f);
    value &= max_value(f);

    for (std::size_t i = 0; i < f.width; ++i) {
        const std::size_t bit = f.offset + i;
        const auto mask = static_cast<std::uint8_t>(0x80u >> (bit % 8));
        if ((value >> (f.width - 1 - i)) & 1u)
            bytes[bit / 8] |= mask;
        else
            bytes[bit / 8] &= static_cast<std::uint8_t>(~mask);
    }
}


template<std::size_t N> std::uint64_t decode(const std::array<std::uint8_t, N> &bytes, const bit_field &f)
{
    check_bounds<N>(f);

    std::uint64_t value = 0;
    for (std::size_t i = 0; i < f.width; ++i) {
        const std::size_t bit = f.offset + i;
        value = (value << 1) | ((bytes[bit / 8] >> (7 - bit % 8)) & 1u);
    }
    return value;
}


// Big-endian integer value of a discriminator
template<std::size_t N> constexpr std::uint64_t to_uint(const std::array<std::uint8_t, N> &bytes)
{
    static_assert(N <= 8, "discriminator wider than 64 bits");
    std::uint64_t value = 0;
    for (auto b: bytes)
        value = (value << 8) | b;
    return value;
}

} // namespace shortid::layout
