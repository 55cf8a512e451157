#include "util/files.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <random>
#include <stdexcept>

using namespace ib::util;

std::string ib::util::readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void ib::util::writeFile(const std::filesystem::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

std::string ib::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

std::filesystem::path ib::util::makeTempPath(const std::string& tag, const std::string& extension) {
    namespace fs = std::filesystem;
    const auto dir = fs::temp_directory_path();

    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = dir / ("inkbridge_" + tag + "_" + generate_random_suffix() + extension);
        if (!fs::exists(candidate)) return candidate;
    }
    throw std::runtime_error("Unable to allocate temporary file in " + dir.string());
}

std::string ib::util::toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string ib::util::lowerExtension(const std::filesystem::path& path) {
    return toLower(path.extension().string());
}
