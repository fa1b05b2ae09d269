#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace gm::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, std::span<const uint8_t> data);

void writeFile(const std::filesystem::path& path, const std::string& data);

bool isEmptyDirectory(const std::filesystem::path& path);

}
