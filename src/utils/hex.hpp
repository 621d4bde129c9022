#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace shortid::utils {

// Lowercase hex, two digits per byte, no separators
std::string to_hex(const std::uint8_t *data, std::size_t size);

template<std::size_t N> std::string to_hex(const std::array<std::uint8_t, N> &bytes)
{
    return to_hex(bytes.data(), bytes.size());
}

} // namespace shortid::utils
