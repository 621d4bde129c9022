#pragma once
#include "sequencer.hpp"
#include "time_source.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>

namespace shortid {

template<std::size_t N> using discriminator = std::array<std::uint8_t, N>;

using bytes8 = std::array<std::uint8_t, 8>;
using bytes12 = std::array<std::uint8_t, 12>;
using bytes16 = std::array<std::uint8_t, 16>;

// 100 ns intervals between 1582-10-15 (Gregorian reform) and 1970-01-01
inline constexpr std::uint64_t gregorian_offset = 0x01B2'1DD2'1381'4000ULL;
// short_96 and short_64 count time in units of 2^13 * 100 ns (819.2 us)
inline constexpr unsigned coarse_shift = 13;

enum class id_kind { uuid_v1, short_128, short_96, short_64 };

struct generator_options {
    std::uint16_t worker_id = 0;
    exhaustion_policy exhaustion = exhaustion_policy::wait;
    std::chrono::microseconds max_wait{10000};
    std::chrono::nanoseconds backward_tolerance = std::chrono::seconds{1};
    // uuidv1 clock sequence of each new tick; random when empty
    std::optional<std::uint16_t> clock_sequence_seed;
};


// Generates time-ordered identifiers in four shapes. Every shape has its own
// sequencer, so uniqueness holds per shape and per generator instance. One
// instance is meant to be created at startup and shared by reference; all
// operations are thread-safe.
class id_generator {
public:
    explicit id_generator(const time_source &clock, const generator_options &options = {});

    id_generator(const id_generator &) = delete;
    id_generator &operator=(const id_generator &) = delete;

    // RFC 4122 version 1 UUID with `node` as node field.
    bytes16 uuidv1(const discriminator<6> &node);

    // v1-compatible layout: 60 bit time, 14 bit sequence, 16 bit worker id, 32 bit machine id.
    // time_low comes first, so byte order follows time only within one tick.
    bytes16 next_short_128(const discriminator<4> &machine);

    // 42 bit coarse time since `epoch`, 14 bit sequence, 16 bit worker id, 24 bit machine id.
    // `epoch` is the time origin in 100 ns units since the Unix epoch. Ids are only
    // unique while every call on this generator passes the same epoch.
    bytes12 next_short_96(const discriminator<3> &machine, std::uint64_t epoch);

    // 42 bit coarse time since `epoch`, 14 bit sequence, 8 bit worker id. Same
    // epoch requirement as next_short_96.
    bytes8 next_short_64(std::uint64_t epoch);

    std::uint16_t worker_id() const { return options_.worker_id; }

    std::optional<sequence_stamp> last_stamp(id_kind kind) const;

private:
    // 100 ns ticks since 1582-10-15
    std::uint64_t gregorian_ticks() const;
    // 2^13 * 100 ns ticks since 1970-01-01
    std::uint64_t coarse_ticks() const;

    std::uint64_t rebase(std::uint64_t coarse_tick, std::uint64_t epoch) const;
    const sequencer &sequencer_for(id_kind kind) const;

    static std::uint16_t random_clock_sequence();

    const time_source &clock_;
    const generator_options options_;
    const std::uint16_t clock_sequence_seed_;

    sequencer uuid_v1_;
    sequencer short_128_;
    sequencer short_96_;
    sequencer short_64_;
};

} // namespace shortid
