#include "packing/codec.hpp"

#include "packing/bit_packing.hpp"
#include "packing/byte_stream.hpp"
#include "packing/types.hpp"

namespace narrowpack::packing {

std::vector<std::uint8_t> packValues(const std::vector<std::uint32_t>& values, std::uint32_t bitWidth)
{
    VectorByteSink sink;
    auto writer = makeBitPackingWriter(bitWidth, sink);

    for (auto value : values) {
        writer->write(value);
    }
    writer->finish();

    return sink.release();
}

std::vector<std::uint32_t> unpackValues(const std::vector<std::uint8_t>& packed, std::size_t count, std::uint32_t bitWidth)
{
    if (packed.size() < packedByteCount(count, bitWidth)) {
        throw SourceExhaustedError();
    }

    MemoryByteSource source(packed);
    auto reader = makeBitPackingReader(bitWidth, source);

    std::vector<std::uint32_t> values;
    values.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        values.push_back(reader->read());
    }

    return values;
}

} // namespace narrowpack::packing
