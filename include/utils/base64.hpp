#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace narrowpack::utils {

// Single-line base64 (no newlines) through OpenSSL's BIO filter.
std::string encodeBase64(const std::vector<std::uint8_t>& data);

// Surrounding whitespace is ignored. Throws std::invalid_argument on
// malformed input.
std::vector<std::uint8_t> decodeBase64(const std::string& text);

} // namespace narrowpack::utils
