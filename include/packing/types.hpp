#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace narrowpack::packing {

inline constexpr std::uint32_t kMaxBitWidth = 8;

using Accumulator = std::uint64_t;

struct GroupLayout {
    std::uint32_t valuesPerGroup {0};
    std::uint32_t bytesPerGroup {0};
};

class UnsupportedWidthError : public std::invalid_argument {
public:
    explicit UnsupportedWidthError(std::uint32_t bitWidth)
        : std::invalid_argument("Unsupported bit width " + std::to_string(bitWidth)
                                + ": only widths 0 to 8 are supported")
        , bitWidth_(bitWidth)
    {
    }

    std::uint32_t bitWidth() const noexcept { return bitWidth_; }

private:
    std::uint32_t bitWidth_;
};

class SourceExhaustedError : public std::runtime_error {
public:
    SourceExhaustedError()
        : std::runtime_error("Byte source exhausted before the requested value")
    {
    }
};

class WriterFinishedError : public std::logic_error {
public:
    WriterFinishedError()
        : std::logic_error("Bit packing writer already finished")
    {
    }
};

constexpr std::uint32_t greatestCommonDivisor(std::uint32_t lhs, std::uint32_t rhs)
{
    while (rhs != 0U) {
        const auto remainder = lhs % rhs;
        lhs = rhs;
        rhs = remainder;
    }
    return lhs;
}

// Smallest run of values whose bit length is a whole number of bytes.
// Width 0 is degenerate: nothing is ever stored.
constexpr GroupLayout groupLayout(std::uint32_t bitWidth)
{
    if (bitWidth == 0U || bitWidth > kMaxBitWidth) {
        return GroupLayout {};
    }
    const auto values = 8U / greatestCommonDivisor(bitWidth, 8U);
    return GroupLayout {values, bitWidth * values / 8U};
}

constexpr Accumulator valueMask(std::uint32_t bitWidth)
{
    return (Accumulator {1} << bitWidth) - 1U;
}

inline void requireSupportedWidth(std::uint32_t bitWidth)
{
    if (bitWidth > kMaxBitWidth) {
        throw UnsupportedWidthError(bitWidth);
    }
}

// Bytes occupied by `count` values once the writer has been finished.
inline std::size_t packedByteCount(std::size_t count, std::uint32_t bitWidth)
{
    requireSupportedWidth(bitWidth);
    if (bitWidth != 0U && count > (std::numeric_limits<std::size_t>::max() - 7U) / bitWidth) {
        throw std::length_error("Value count " + std::to_string(count) + " overflows the packed size at width "
                                + std::to_string(bitWidth));
    }
    return (count * bitWidth + 7U) / 8U;
}

} // namespace narrowpack::packing
