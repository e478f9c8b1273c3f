#include "utils/value_text.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace narrowpack::utils {
namespace {

bool isSeparator(char character)
{
    return character == ',' || std::isspace(static_cast<unsigned char>(character)) != 0;
}

std::uint32_t parseToken(const std::string& token)
{
    constexpr auto kMaxValue = static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max());

    std::uint64_t value = 0;
    for (char character : token) {
        if (std::isdigit(static_cast<unsigned char>(character)) == 0) {
            throw std::invalid_argument("Invalid value token: " + token);
        }
        value = value * 10U + static_cast<std::uint64_t>(character - '0');
        if (value > kMaxValue) {
            throw std::out_of_range("Value does not fit in 32 bits: " + token);
        }
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

std::vector<std::uint32_t> parseValues(const std::string& text)
{
    std::vector<std::uint32_t> values;
    std::string token;

    for (char character : text) {
        if (!isSeparator(character)) {
            token.push_back(character);
            continue;
        }
        if (!token.empty()) {
            values.push_back(parseToken(token));
            token.clear();
        }
    }

    if (!token.empty()) {
        values.push_back(parseToken(token));
    }

    return values;
}

std::string formatValues(const std::vector<std::uint32_t>& values)
{
    std::ostringstream output;
    for (auto value : values) {
        output << value << '\n';
    }
    return output.str();
}

} // namespace narrowpack::utils
