#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace narrowpack::utils {

// Decimal values separated by whitespace and/or commas.
std::vector<std::uint32_t> parseValues(const std::string& text);

// One value per line, newline terminated.
std::string formatValues(const std::vector<std::uint32_t>& values);

} // namespace narrowpack::utils
