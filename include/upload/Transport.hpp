#pragma once

#include "http/Client.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace ib::upload {

/**
 * Stateful upload client for the tablet's web interface.
 *
 * POST /upload drops the file into whatever folder the last
 * GET /documents/{id} opened, so uploads must be strictly sequential and a
 * navigate() has to precede the first upload into a folder.
 */
class Transport {
public:
    Transport(std::shared_ptr<http::Client> client, std::string address,
              std::chrono::milliseconds listingTimeout = std::chrono::seconds(10),
              std::chrono::milliseconds uploadTimeout = std::chrono::seconds(120));

    // Logs and swallows failures; the upload is attempted regardless.
    void navigate(const std::string& folderId) const;

    nlohmann::json upload(const std::filesystem::path& localPath, const std::string& folderId,
                          const std::string& displayName, bool injectCover,
                          const http::ProgressFn& onProgress = {}, bool navigateFirst = true) const;

private:
    std::shared_ptr<http::Client> client_;
    std::string address_;
    std::chrono::milliseconds listingTimeout_, uploadTimeout_;
};

}
