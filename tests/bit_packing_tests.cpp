#include "packing/bit_packing.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

using narrowpack::packing::ByteSink;
using narrowpack::packing::ByteSource;
using narrowpack::packing::GroupBitPackingReader;
using narrowpack::packing::GroupBitPackingWriter;
using narrowpack::packing::InputStreamByteSource;
using narrowpack::packing::MemoryByteSource;
using narrowpack::packing::OutputStreamByteSink;
using narrowpack::packing::SourceExhaustedError;
using narrowpack::packing::UnsupportedWidthError;
using narrowpack::packing::VectorByteSink;
using narrowpack::packing::WriterFinishedError;
using narrowpack::packing::makeBitPackingReader;
using narrowpack::packing::makeBitPackingWriter;

class FailingByteSink : public ByteSink {
public:
    explicit FailingByteSink(std::size_t acceptedBytes)
        : acceptedBytes_(acceptedBytes)
    {
    }

    void write(std::uint8_t) override
    {
        if (acceptedBytes_ == 0U) {
            throw std::runtime_error("sink closed");
        }
        --acceptedBytes_;
    }

private:
    std::size_t acceptedBytes_;
};

class FailingByteSource : public ByteSource {
public:
    bool read(std::uint8_t&) override
    {
        throw std::runtime_error("device error");
    }
};

std::vector<std::uint8_t> packAll(std::uint32_t width, const std::vector<std::uint32_t>& values)
{
    VectorByteSink sink;
    auto writer = makeBitPackingWriter(width, sink);
    for (auto value : values) {
        writer->write(value);
    }
    writer->finish();
    return sink.release();
}

std::vector<std::uint32_t> readAll(std::uint32_t width, const std::vector<std::uint8_t>& bytes, std::size_t count)
{
    MemoryByteSource source(bytes);
    auto reader = makeBitPackingReader(width, source);
    std::vector<std::uint32_t> values;
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(reader->read());
    }
    return values;
}

// Deterministic spread of values over [0, 2^width - 1].
std::vector<std::uint32_t> sampleValues(std::uint32_t width, std::size_t count)
{
    std::vector<std::uint32_t> values;
    values.reserve(count);
    const std::uint32_t mask = (1U << width) - 1U;
    std::uint32_t state = 0x2545F491U;
    for (std::size_t i = 0; i < count; ++i) {
        state = state * 1103515245U + 12345U;
        values.push_back((state >> 16U) & mask);
    }
    return values;
}

TEST(BitPackingTest, ThreeBitGroupMatchesBitConcatenation)
{
    const std::vector<std::uint32_t> values = {5, 3, 2, 7, 0, 1, 6, 4};

    const auto bytes = packAll(3, values);

    // 101 011 010 111 000 001 110 100
    const std::vector<std::uint8_t> expected = {0xAD, 0x70, 0x74};
    EXPECT_EQ(bytes, expected);
    EXPECT_EQ(readAll(3, bytes, values.size()), values);
}

TEST(BitPackingTest, FiveBitFullGroupHasNoTrailingByte)
{
    const std::vector<std::uint32_t> values = {1, 2, 3, 4, 5, 6, 7, 8};

    const auto bytes = packAll(5, values);

    const std::vector<std::uint8_t> expected = {0x08, 0x86, 0x42, 0x98, 0xE8};
    EXPECT_EQ(bytes, expected);
    EXPECT_EQ(readAll(5, bytes, values.size()), values);
}

TEST(BitPackingTest, RoundTripsEveryWidth)
{
    for (std::uint32_t width = 0; width <= 8; ++width) {
        for (std::size_t count : {0U, 1U, 7U, 8U, 9U, 63U, 100U}) {
            const auto values = sampleValues(width, count);
            const auto bytes = packAll(width, values);
            EXPECT_EQ(readAll(width, bytes, count), values) << "width " << width << " count " << count;
        }
    }
}

TEST(BitPackingTest, FinishedStreamLengthIsCeilOfTotalBits)
{
    for (std::uint32_t width = 0; width <= 8; ++width) {
        for (std::size_t count = 0; count <= 17; ++count) {
            const auto bytes = packAll(width, sampleValues(width, count));
            EXPECT_EQ(bytes.size(), (count * width + 7U) / 8U) << "width " << width << " count " << count;
        }
    }
}

TEST(BitPackingTest, MidStreamOutputIsWholeGroups)
{
    VectorByteSink sink;
    auto writer = makeBitPackingWriter(6, sink);

    for (std::uint32_t value = 0; value < 7; ++value) {
        writer->write(value);
    }
    // 7 values: one complete 4-value group of 3 bytes, three values held back
    EXPECT_EQ(sink.bytes().size(), 3U);

    writer->write(7);
    EXPECT_EQ(sink.bytes().size(), 6U);
    EXPECT_EQ(writer->valueCount(), 8U);
}

TEST(BitPackingTest, FinishPadsPartialGroupWithZeroBits)
{
    EXPECT_EQ(packAll(3, {5}), (std::vector<std::uint8_t> {0xA0}));
    EXPECT_EQ(packAll(7, {1, 2}), (std::vector<std::uint8_t> {0x02, 0x08}));
    EXPECT_EQ(packAll(6, {63, 0, 42}), (std::vector<std::uint8_t> {0xFC, 0x0A, 0x80}));
    EXPECT_EQ(packAll(1, {1, 0, 1, 1, 0, 0, 1, 0, 1}), (std::vector<std::uint8_t> {0xB2, 0x80}));
}

TEST(BitPackingTest, PaddingDecodesAsZero)
{
    const auto bytes = packAll(2, {3, 1, 2});
    ASSERT_EQ(bytes, (std::vector<std::uint8_t> {0xD8}));

    MemoryByteSource source(bytes);
    auto reader = makeBitPackingReader(2, source);
    EXPECT_EQ(reader->read(), 3U);
    EXPECT_EQ(reader->read(), 1U);
    EXPECT_EQ(reader->read(), 2U);
    EXPECT_EQ(reader->read(), 0U);
    EXPECT_THROW(reader->read(), SourceExhaustedError);
}

TEST(BitPackingTest, TruncatedTrailingGroupStopsAtLastByte)
{
    // One 3-bit value packs into a single byte: 101 000 00
    const std::vector<std::uint8_t> bytes = {0xA0};
    MemoryByteSource source(bytes);
    GroupBitPackingReader<3> reader(source);

    EXPECT_EQ(reader.read(), 5U);
    EXPECT_EQ(reader.read(), 0U);
    EXPECT_THROW(reader.read(), SourceExhaustedError);
}

TEST(BitPackingTest, DecodingStopsAtEndOfPackedSection)
{
    for (std::uint32_t width : {3U, 5U, 6U, 7U}) {
        for (std::size_t count = 1; count <= 9; ++count) {
            const auto values = sampleValues(width, count);

            VectorByteSink sink;
            auto writer = makeBitPackingWriter(width, sink);
            for (auto value : values) {
                writer->write(value);
            }
            writer->finish();
            const auto packedSize = sink.bytes().size();
            sink.write(0xFF);
            sink.write(0xEE);

            MemoryByteSource source(sink.bytes());
            auto reader = makeBitPackingReader(width, source);
            for (auto value : values) {
                EXPECT_EQ(reader->read(), value) << "width " << width << " count " << count;
            }

            ASSERT_EQ(source.remaining(), 2U) << "width " << width << " count " << count
                                              << " packed " << packedSize;
            std::uint8_t byte = 0;
            ASSERT_TRUE(source.read(byte));
            EXPECT_EQ(byte, 0xFF);
            ASSERT_TRUE(source.read(byte));
            EXPECT_EQ(byte, 0xEE);
        }
    }
}

TEST(BitPackingTest, StreamSourceKeepsBytesAfterShortGroup)
{
    std::stringstream stream(std::ios::in | std::ios::out | std::ios::binary);
    OutputStreamByteSink sink(stream);
    GroupBitPackingWriter<3> writer(sink);
    writer.write(5);
    writer.finish();
    sink.write(0xFF);
    sink.write(0xEE);

    InputStreamByteSource source(stream);
    GroupBitPackingReader<3> reader(source);
    EXPECT_EQ(reader.read(), 5U);

    std::uint8_t byte = 0;
    ASSERT_TRUE(source.read(byte));
    EXPECT_EQ(byte, 0xFF);
    ASSERT_TRUE(source.read(byte));
    EXPECT_EQ(byte, 0xEE);
    EXPECT_FALSE(source.read(byte));
}

TEST(BitPackingTest, ReadingEmptySourceReportsExhaustion)
{
    for (std::uint32_t width = 1; width <= 8; ++width) {
        MemoryByteSource source(nullptr, 0);
        auto reader = makeBitPackingReader(width, source);
        EXPECT_THROW(reader->read(), SourceExhaustedError) << "width " << width;
    }
}

TEST(BitPackingTest, ZeroWidthWritesNothingAndReadsZeros)
{
    VectorByteSink sink;
    GroupBitPackingWriter<0> writer(sink);
    for (std::uint32_t value = 0; value < 100; ++value) {
        writer.write(value);
    }
    writer.finish();
    EXPECT_TRUE(sink.bytes().empty());
    EXPECT_EQ(writer.valueCount(), 100U);

    MemoryByteSource source(nullptr, 0);
    auto reader = makeBitPackingReader(0, source);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(reader->read(), 0U);
    }
}

TEST(BitPackingTest, EightBitWidthIsByteCopy)
{
    VectorByteSink sink;
    auto writer = makeBitPackingWriter(8, sink);

    writer->write(0x12);
    EXPECT_EQ(sink.bytes(), (std::vector<std::uint8_t> {0x12}));
    writer->write(0xFF);
    writer->write(0x00);
    writer->finish();
    EXPECT_EQ(sink.bytes(), (std::vector<std::uint8_t> {0x12, 0xFF, 0x00}));

    const std::vector<std::uint8_t> raw = {0x00, 0x7F, 0x80, 0xFE};
    EXPECT_EQ(readAll(8, raw, raw.size()), (std::vector<std::uint32_t> {0x00, 0x7F, 0x80, 0xFE}));
}

TEST(BitPackingTest, OutOfRangeValuesAreMasked)
{
    EXPECT_EQ(packAll(4, {0x1F, 0x23}), packAll(4, {0x0F, 0x03}));
    EXPECT_EQ(packAll(8, {0x1AB}), (std::vector<std::uint8_t> {0xAB}));
}

TEST(BitPackingTest, WriteAfterFinishIsRejected)
{
    for (std::uint32_t width = 0; width <= 8; ++width) {
        VectorByteSink sink;
        auto writer = makeBitPackingWriter(width, sink);
        writer->write(0);
        EXPECT_FALSE(writer->isFinished());

        writer->finish();
        EXPECT_TRUE(writer->isFinished());
        EXPECT_THROW(writer->write(0), WriterFinishedError) << "width " << width;

        const auto written = sink.bytes().size();
        EXPECT_NO_THROW(writer->finish());
        EXPECT_EQ(sink.bytes().size(), written);
    }
}

TEST(BitPackingTest, SelectorRejectsWidthsAboveEight)
{
    VectorByteSink sink;
    MemoryByteSource source(nullptr, 0);

    EXPECT_THROW(makeBitPackingWriter(9, sink), UnsupportedWidthError);
    EXPECT_THROW(makeBitPackingReader(9, source), UnsupportedWidthError);
    EXPECT_THROW(makeBitPackingWriter(32, sink), std::invalid_argument);

    try {
        makeBitPackingReader(12, source);
        FAIL() << "expected UnsupportedWidthError";
    } catch (const UnsupportedWidthError& error) {
        EXPECT_EQ(error.bitWidth(), 12U);
    }
}

TEST(BitPackingTest, SelectorReturnsRequestedWidth)
{
    VectorByteSink sink;
    MemoryByteSource source(nullptr, 0);

    for (std::uint32_t width = 0; width <= 8; ++width) {
        EXPECT_EQ(makeBitPackingWriter(width, sink)->bitWidth(), width);
        EXPECT_EQ(makeBitPackingReader(width, source)->bitWidth(), width);
    }
}

TEST(BitPackingTest, SinkFailurePropagates)
{
    FailingByteSink sink(1);
    GroupBitPackingWriter<5> writer(sink);

    for (std::uint32_t value = 0; value < 7; ++value) {
        writer.write(value);
    }
    EXPECT_THROW(writer.write(7), std::runtime_error);
}

TEST(BitPackingTest, SourceFailureIsNotExhaustion)
{
    FailingByteSource source;
    auto reader = makeBitPackingReader(4, source);

    try {
        reader->read();
        FAIL() << "expected the source error to propagate";
    } catch (const SourceExhaustedError&) {
        FAIL() << "I/O failure reported as exhaustion";
    } catch (const std::runtime_error& error) {
        EXPECT_STREQ(error.what(), "device error");
    }
}

} // namespace
