#pragma once
#include "id_generator.hpp"
#include <cstdint>

namespace shortid {

// Widens a short_96 id into a version 1 UUID. The coarse time is scaled back
// to 100 ns ticks since 1582-10-15, sequence and worker id are carried over and
// machine_hi becomes the top byte of the 32 bit machine id.
bytes16 short_96_to_128(const bytes12 &id, std::uint64_t epoch, std::uint8_t machine_hi);

// The 8 bit worker id is widened to 16 bits.
bytes12 short_64_to_96(const bytes8 &id, const discriminator<3> &machine);

bytes16 short_64_to_128(const bytes8 &id, std::uint64_t epoch, const discriminator<4> &machine);


struct uuid_fields {
    std::uint64_t timestamp; // 100 ns ticks since 1582-10-15
    std::uint16_t clock_sequence;
    std::uint8_t version;
    std::uint8_t variant; // two most significant bits of byte 8
    discriminator<6> node;
};

uuid_fields parse_uuid_v1(const bytes16 &id);

} // namespace shortid
