#include "utils/base64.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <stdexcept>

namespace narrowpack::utils {
namespace {

using BioChain = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

BioChain makeBase64Chain(BIO* sinkOrSource)
{
    if (sinkOrSource == nullptr) {
        throw std::runtime_error("Failed to allocate OpenSSL memory BIO");
    }

    BIO* filter = BIO_new(BIO_f_base64());
    if (filter == nullptr) {
        BIO_free(sinkOrSource);
        throw std::runtime_error("Failed to allocate OpenSSL base64 BIO");
    }

    BIO_set_flags(filter, BIO_FLAGS_BASE64_NO_NL);
    return BioChain(BIO_push(filter, sinkOrSource), &BIO_free_all);
}

bool isBase64Character(char character)
{
    const auto value = static_cast<unsigned char>(character);
    return std::isalnum(value) != 0 || character == '+' || character == '/';
}

std::string trimWhitespace(const std::string& text)
{
    const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    const auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    const auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return first < last ? std::string(first, last) : std::string {};
}

// Length of the decoded payload, or throws if the text is not canonical base64.
std::size_t expectedDecodedSize(const std::string& text)
{
    if (text.size() % 4U != 0U) {
        throw std::invalid_argument("Base64 input length must be a multiple of 4");
    }

    std::size_t padding = 0;
    for (std::size_t index = 0; index < text.size(); ++index) {
        const char character = text[index];
        if (character == '=') {
            if (index + 2U < text.size()) {
                throw std::invalid_argument("Base64 padding found before the end of input");
            }
            ++padding;
            continue;
        }
        if (padding > 0U || !isBase64Character(character)) {
            throw std::invalid_argument("Invalid character in base64 input");
        }
    }

    return text.size() / 4U * 3U - padding;
}

} // namespace

std::string encodeBase64(const std::vector<std::uint8_t>& data)
{
    if (data.empty()) {
        return {};
    }
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::length_error("Buffer too large for base64 encoding");
    }

    auto chain = makeBase64Chain(BIO_new(BIO_s_mem()));

    const auto length = static_cast<int>(data.size());
    if (BIO_write(chain.get(), data.data(), length) != length) {
        throw std::runtime_error("Failed to base64-encode buffer");
    }
    if (BIO_flush(chain.get()) != 1) {
        throw std::runtime_error("Failed to flush base64 encoder");
    }

    BUF_MEM* memory = nullptr;
    BIO_get_mem_ptr(chain.get(), &memory);
    if (memory == nullptr) {
        throw std::runtime_error("Failed to access base64 output buffer");
    }

    return std::string(memory->data, memory->length);
}

std::vector<std::uint8_t> decodeBase64(const std::string& text)
{
    const auto trimmed = trimWhitespace(text);
    const auto expected = expectedDecodedSize(trimmed);
    if (expected == 0U) {
        return {};
    }
    if (trimmed.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::length_error("Text too large for base64 decoding");
    }

    auto chain = makeBase64Chain(BIO_new_mem_buf(trimmed.data(), static_cast<int>(trimmed.size())));

    std::vector<std::uint8_t> data(expected);
    std::size_t decoded = 0;
    while (decoded < expected) {
        const auto length = BIO_read(chain.get(), data.data() + decoded, static_cast<int>(expected - decoded));
        if (length <= 0) {
            break;
        }
        decoded += static_cast<std::size_t>(length);
    }

    if (decoded != expected) {
        throw std::invalid_argument("Malformed base64 input");
    }

    return data;
}

} // namespace narrowpack::utils
