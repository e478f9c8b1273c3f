#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace narrowpack::utils {

void ensureParentDirectory(const std::filesystem::path& path);

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);
std::string readFileText(const std::filesystem::path& path);

void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);
void writeTextToFile(const std::filesystem::path& path, const std::string& text);

} // namespace narrowpack::utils
