#include "hex.hpp"
#include <fmt/core.h>

namespace shortid::utils {

std::string to_hex(const std::uint8_t *data, std::size_t size)
{
    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i)
        result += fmt::format("{:02x}", data[i]);
    return result;
}

} // namespace shortid::utils
