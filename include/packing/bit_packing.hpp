#pragma once

#include "packing/byte_stream.hpp"
#include "packing/types.hpp"

#include <cstdint>
#include <memory>

namespace narrowpack::packing {

// Writes values using exactly bitWidth() bits each. Values wider than the
// bit width are masked to their low bits.
class BitPackingWriter {
public:
    virtual ~BitPackingWriter() = default;

    virtual void write(std::uint32_t value) = 0;

    // Zero-pads a partial trailing group to the next byte boundary and
    // flushes it. No write is accepted afterwards.
    virtual void finish() = 0;

    virtual bool isFinished() const noexcept = 0;
    virtual std::uint64_t valueCount() const noexcept = 0;
    virtual std::uint32_t bitWidth() const noexcept = 0;
};

class BitPackingReader {
public:
    virtual ~BitPackingReader() = default;

    // Throws SourceExhaustedError when the source holds no bits for the value.
    virtual std::uint32_t read() = 0;

    virtual std::uint32_t bitWidth() const noexcept = 0;
};

// The sink/source must outlive the returned instance.
std::unique_ptr<BitPackingWriter> makeBitPackingWriter(std::uint32_t bitWidth, ByteSink& sink);
std::unique_ptr<BitPackingReader> makeBitPackingReader(std::uint32_t bitWidth, ByteSource& source);

template <std::uint32_t Width>
class GroupBitPackingWriter final : public BitPackingWriter {
public:
    static_assert(Width <= kMaxBitWidth, "bit width must be in [0, 8]");

    explicit GroupBitPackingWriter(ByteSink& sink);

    GroupBitPackingWriter(const GroupBitPackingWriter&) = delete;
    GroupBitPackingWriter& operator=(const GroupBitPackingWriter&) = delete;

    void write(std::uint32_t value) override;
    void finish() override;

    bool isFinished() const noexcept override { return sink_ == nullptr; }
    std::uint64_t valueCount() const noexcept override { return written_; }
    std::uint32_t bitWidth() const noexcept override { return Width; }

private:
    static constexpr GroupLayout kLayout = groupLayout(Width);

    void flush(std::uint32_t byteCount);

    ByteSink* sink_ {nullptr};
    Accumulator buffer_ {0};
    std::uint32_t count_ {0};
    std::uint64_t written_ {0};
};

template <std::uint32_t Width>
class GroupBitPackingReader final : public BitPackingReader {
public:
    static_assert(Width <= kMaxBitWidth, "bit width must be in [0, 8]");

    explicit GroupBitPackingReader(ByteSource& source);

    GroupBitPackingReader(const GroupBitPackingReader&) = delete;
    GroupBitPackingReader& operator=(const GroupBitPackingReader&) = delete;

    std::uint32_t read() override;

    std::uint32_t bitWidth() const noexcept override { return Width; }

private:
    static constexpr GroupLayout kLayout = groupLayout(Width);

    void fetchBits(std::uint32_t bitCount);

    ByteSource& source_;
    Accumulator buffer_ {0};
    std::uint32_t remaining_ {0};
    std::uint32_t loadedBytes_ {0};
};

// Template definitions

template <std::uint32_t Width>
GroupBitPackingWriter<Width>::GroupBitPackingWriter(ByteSink& sink)
    : sink_(&sink)
{
}

template <std::uint32_t Width>
void GroupBitPackingWriter<Width>::write(std::uint32_t value)
{
    if (sink_ == nullptr) {
        throw WriterFinishedError();
    }

    ++written_;
    if constexpr (Width != 0U) {
        buffer_ = (buffer_ << Width) | (static_cast<Accumulator>(value) & valueMask(Width));
        ++count_;
        if (count_ == kLayout.valuesPerGroup) {
            flush(kLayout.bytesPerGroup);
        }
    }
}

template <std::uint32_t Width>
void GroupBitPackingWriter<Width>::finish()
{
    if (sink_ == nullptr) {
        return;
    }

    if constexpr (Width != 0U) {
        if (count_ > 0U) {
            const auto usedBits = count_ * Width;
            buffer_ <<= (kLayout.valuesPerGroup - count_) * Width;
            flush((usedBits + 7U) / 8U);
        }
    }

    sink_ = nullptr;
}

// Emits the leading byteCount bytes of the group, most significant first.
template <std::uint32_t Width>
void GroupBitPackingWriter<Width>::flush(std::uint32_t byteCount)
{
    for (std::uint32_t index = 0; index < byteCount; ++index) {
        const auto shift = 8U * (kLayout.bytesPerGroup - 1U - index);
        sink_->write(static_cast<std::uint8_t>((buffer_ >> shift) & 0xFFU));
    }
    buffer_ = 0;
    count_ = 0;
}

template <std::uint32_t Width>
GroupBitPackingReader<Width>::GroupBitPackingReader(ByteSource& source)
    : source_(source)
{
}

template <std::uint32_t Width>
std::uint32_t GroupBitPackingReader<Width>::read()
{
    if constexpr (Width == 0U) {
        return 0;
    } else {
        if (remaining_ == 0U) {
            buffer_ = 0;
            loadedBytes_ = 0;
            remaining_ = kLayout.valuesPerGroup;
        }

        const auto index = kLayout.valuesPerGroup - remaining_;
        fetchBits((index + 1U) * Width);

        --remaining_;
        return static_cast<std::uint32_t>((buffer_ >> (remaining_ * Width)) & valueMask(Width));
    }
}

// Pulls bytes into the group register, most significant first, until its
// leading bitCount bits are loaded. Bytes past the window are left in the
// source, so a short trailing group consumes only the bytes it occupies.
template <std::uint32_t Width>
void GroupBitPackingReader<Width>::fetchBits(std::uint32_t bitCount)
{
    std::uint8_t byte = 0;
    while (8U * loadedBytes_ < bitCount) {
        if (!source_.read(byte)) {
            throw SourceExhaustedError();
        }
        const auto shift = 8U * (kLayout.bytesPerGroup - 1U - loadedBytes_);
        buffer_ |= static_cast<Accumulator>(byte) << shift;
        ++loadedBytes_;
    }
}

} // namespace narrowpack::packing
