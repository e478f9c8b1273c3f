#include "packing/byte_stream.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace narrowpack::packing {

void VectorByteSink::write(std::uint8_t byte)
{
    buffer_.push_back(byte);
}

const std::vector<std::uint8_t>& VectorByteSink::bytes() const noexcept
{
    return buffer_;
}

std::vector<std::uint8_t> VectorByteSink::release()
{
    return std::move(buffer_);
}

MemoryByteSource::MemoryByteSource(const std::uint8_t* data, std::size_t size)
    : data_(data)
    , size_(size)
{
    if (data_ == nullptr && size_ != 0U) {
        throw std::invalid_argument("MemoryByteSource given a null buffer with non-zero size");
    }
}

MemoryByteSource::MemoryByteSource(const std::vector<std::uint8_t>& data)
    : MemoryByteSource(data.data(), data.size())
{
}

bool MemoryByteSource::read(std::uint8_t& byte)
{
    if (position_ >= size_) {
        return false;
    }
    byte = data_[position_++];
    return true;
}

std::size_t MemoryByteSource::remaining() const noexcept
{
    return size_ - position_;
}

OutputStreamByteSink::OutputStreamByteSink(std::ostream& output)
    : output_(output)
{
}

void OutputStreamByteSink::write(std::uint8_t byte)
{
    output_.put(static_cast<char>(byte));
    if (!output_) {
        throw std::runtime_error("Failed to write byte to output stream");
    }
}

InputStreamByteSource::InputStreamByteSource(std::istream& input)
    : input_(input)
{
}

bool InputStreamByteSource::read(std::uint8_t& byte)
{
    const auto value = input_.get();
    if (value == std::char_traits<char>::eof()) {
        if (input_.bad() || !input_.eof()) {
            throw std::runtime_error("Failed to read byte from input stream");
        }
        return false;
    }
    if (input_.bad()) {
        throw std::runtime_error("Failed to read byte from input stream");
    }
    byte = static_cast<std::uint8_t>(value);
    return true;
}

} // namespace narrowpack::packing
