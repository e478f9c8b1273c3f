#include "packing/bit_packing.hpp"

namespace narrowpack::packing {

std::unique_ptr<BitPackingWriter> makeBitPackingWriter(std::uint32_t bitWidth, ByteSink& sink)
{
    switch (bitWidth) {
    case 0: return std::make_unique<GroupBitPackingWriter<0>>(sink);
    case 1: return std::make_unique<GroupBitPackingWriter<1>>(sink);
    case 2: return std::make_unique<GroupBitPackingWriter<2>>(sink);
    case 3: return std::make_unique<GroupBitPackingWriter<3>>(sink);
    case 4: return std::make_unique<GroupBitPackingWriter<4>>(sink);
    case 5: return std::make_unique<GroupBitPackingWriter<5>>(sink);
    case 6: return std::make_unique<GroupBitPackingWriter<6>>(sink);
    case 7: return std::make_unique<GroupBitPackingWriter<7>>(sink);
    case 8: return std::make_unique<GroupBitPackingWriter<8>>(sink);
    default:
        throw UnsupportedWidthError(bitWidth);
    }
}

std::unique_ptr<BitPackingReader> makeBitPackingReader(std::uint32_t bitWidth, ByteSource& source)
{
    switch (bitWidth) {
    case 0: return std::make_unique<GroupBitPackingReader<0>>(source);
    case 1: return std::make_unique<GroupBitPackingReader<1>>(source);
    case 2: return std::make_unique<GroupBitPackingReader<2>>(source);
    case 3: return std::make_unique<GroupBitPackingReader<3>>(source);
    case 4: return std::make_unique<GroupBitPackingReader<4>>(source);
    case 5: return std::make_unique<GroupBitPackingReader<5>>(source);
    case 6: return std::make_unique<GroupBitPackingReader<6>>(source);
    case 7: return std::make_unique<GroupBitPackingReader<7>>(source);
    case 8: return std::make_unique<GroupBitPackingReader<8>>(source);
    default:
        throw UnsupportedWidthError(bitWidth);
    }
}

} // namespace narrowpack::packing
