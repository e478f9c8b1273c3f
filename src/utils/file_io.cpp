#include "utils/file_io.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace narrowpack::utils {
namespace {

std::ofstream openForWriting(const std::filesystem::path& path)
{
    ensureParentDirectory(path);

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    return output;
}

} // namespace

void ensureParentDirectory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("create_directories", parent, ec);
    }
}

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw std::runtime_error("Failed to read file contents: " + path.string());
    }
    return data;
}

std::string readFileText(const std::filesystem::path& path)
{
    const auto bytes = readFileBytes(path);
    return std::string(bytes.begin(), bytes.end());
}

void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data)
{
    auto output = openForWriting(path);

    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output) {
            throw std::runtime_error("Failed to write file contents: " + path.string());
        }
    }
}

void writeTextToFile(const std::filesystem::path& path, const std::string& text)
{
    auto output = openForWriting(path);

    output << text;
    if (!output) {
        throw std::runtime_error("Failed to write file contents: " + path.string());
    }
}

} // namespace narrowpack::utils
