#pragma once

#include <filesystem>
#include <string>

namespace ib::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::string& data);

std::string generate_random_suffix(size_t length = 8);

// Unused path in the system temp directory, e.g. /tmp/inkbridge_epub_Xa91bQz2.epub
std::filesystem::path makeTempPath(const std::string& tag, const std::string& extension);

std::string toLower(std::string s);

// Extension including the dot, lower-cased (".epub")
std::string lowerExtension(const std::filesystem::path& path);

}
