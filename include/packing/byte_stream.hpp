#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace narrowpack::packing {

// Sequential single-byte output. Implementations throw std::runtime_error
// when the byte cannot be written.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void write(std::uint8_t byte) = 0;
};

// Sequential single-byte input. Returns false once no data is left and
// throws std::runtime_error on a read failure.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual bool read(std::uint8_t& byte) = 0;
};

class VectorByteSink final : public ByteSink {
public:
    VectorByteSink() = default;

    void write(std::uint8_t byte) override;

    const std::vector<std::uint8_t>& bytes() const noexcept;
    std::vector<std::uint8_t> release();

private:
    std::vector<std::uint8_t> buffer_;
};

class MemoryByteSource final : public ByteSource {
public:
    MemoryByteSource(const std::uint8_t* data, std::size_t size);
    explicit MemoryByteSource(const std::vector<std::uint8_t>& data);

    bool read(std::uint8_t& byte) override;

    std::size_t remaining() const noexcept;

private:
    const std::uint8_t* data_ {nullptr};
    std::size_t size_ {0};
    std::size_t position_ {0};
};

class OutputStreamByteSink final : public ByteSink {
public:
    explicit OutputStreamByteSink(std::ostream& output);

    void write(std::uint8_t byte) override;

private:
    std::ostream& output_;
};

class InputStreamByteSource final : public ByteSource {
public:
    explicit InputStreamByteSource(std::istream& input);

    bool read(std::uint8_t& byte) override;

private:
    std::istream& input_;
};

} // namespace narrowpack::packing
