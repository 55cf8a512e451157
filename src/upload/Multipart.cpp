#include "upload/Multipart.hpp"
#include "util/files.hpp"

#include <unordered_map>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

using namespace ib::upload;

namespace {

// Formats the tablet understands come first; the rest is a best guess.
const std::unordered_map<std::string, std::string> DEVICE_TYPES{
    {".epub", "application/epub+zip"},
    {".pdf", "application/pdf"},
};

const std::unordered_map<std::string, std::string> GUESSED_TYPES{
    {".txt", "text/plain"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".xhtml", "application/xhtml+xml"},
    {".json", "application/json"},
    {".zip", "application/zip"},
    {".mobi", "application/x-mobipocket-ebook"},
    {".azw3", "application/vnd.amazon.ebook"},
    {".djvu", "image/vnd.djvu"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
};

std::string quoteFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        if (c == '"') out += "%22";
        else if (c == '\r' || c == '\n') out += ' ';
        else out += c;
    }
    return out;
}

}

std::string ib::upload::contentTypeFor(const std::filesystem::path& filename) {
    const auto ext = util::lowerExtension(filename);
    if (const auto it = DEVICE_TYPES.find(ext); it != DEVICE_TYPES.end()) return it->second;
    if (const auto it = GUESSED_TYPES.find(ext); it != GUESSED_TYPES.end()) return it->second;
    return "application/octet-stream";
}

std::string ib::upload::makeBoundary() {
    const auto id = boost::uuids::random_generator()();
    std::string hex;
    hex.reserve(32);
    for (const auto byte : id) hex += fmt::format("{:02x}", static_cast<unsigned int>(byte));
    return "----inkbridge-" + hex;
}

MultipartBody ib::upload::buildMultipart(const std::string& filename, const std::string& payload,
                                         std::string partContentType) {
    if (partContentType.empty()) partContentType = contentTypeFor(filename);

    MultipartBody mp;
    mp.boundary = makeBoundary();
    mp.content_type = "multipart/form-data; boundary=" + mp.boundary;

    const auto head = fmt::format("--{}\r\n"
                                  "Content-Disposition: form-data; name=\"file\"; filename=\"{}\"\r\n"
                                  "Content-Type: {}\r\n"
                                  "\r\n", mp.boundary, quoteFilename(filename), partContentType);
    const auto tail = fmt::format("\r\n--{}--\r\n", mp.boundary);

    mp.data.reserve(head.size() + payload.size() + tail.size());
    mp.data += head;
    mp.data += payload;
    mp.data += tail;
    return mp;
}
