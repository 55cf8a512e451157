#pragma once

#include <filesystem>
#include <string>

namespace ib::upload {

struct MultipartBody {
    std::string boundary;
    std::string content_type;   // value for the request's Content-Type header
    std::string data;
};

std::string contentTypeFor(const std::filesystem::path& filename);

std::string makeBoundary();

// Single part named "file"; an empty partContentType is resolved from the filename.
MultipartBody buildMultipart(const std::string& filename, const std::string& payload,
                             std::string partContentType = "");

}
