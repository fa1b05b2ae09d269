#include "util/files.hpp"

#include <fstream>
#include <stdexcept>

std::vector<uint8_t> gm::util::readFileToVector(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void gm::util::writeFile(const std::filesystem::path& path, const std::span<const uint8_t> data) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());

    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void gm::util::writeFile(const std::filesystem::path& path, const std::string& data) {
    writeFile(path, std::span(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

bool gm::util::isEmptyDirectory(const std::filesystem::path& path) {
    return std::filesystem::directory_iterator(path) == std::filesystem::directory_iterator();
}
