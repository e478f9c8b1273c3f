#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace narrowpack::packing {

std::vector<std::uint8_t> packValues(const std::vector<std::uint32_t>& values, std::uint32_t bitWidth);
std::vector<std::uint32_t> unpackValues(const std::vector<std::uint8_t>& packed, std::size_t count, std::uint32_t bitWidth);

} // namespace narrowpack::packing
