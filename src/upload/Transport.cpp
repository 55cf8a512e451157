#include "upload/Transport.hpp"
#include "upload/Multipart.hpp"
#include "device/Api.hpp"
#include "epub/Repackager.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <fmt/format.h>

using namespace ib::upload;
using namespace ib::device;
using namespace ib::log;

Transport::Transport(std::shared_ptr<http::Client> client, std::string address,
                     const std::chrono::milliseconds listingTimeout, const std::chrono::milliseconds uploadTimeout)
    : client_(std::move(client)), address_(std::move(address)),
      listingTimeout_(listingTimeout), uploadTimeout_(uploadTimeout) {
    if (!client_) throw std::invalid_argument("Transport requires an HTTP client");
}

void Transport::navigate(const std::string& folderId) const {
    try {
        const auto res = client_->get(api::listingRequest(address_, folderId, listingTimeout_));
        if (res.transportFailed())
            Registry::upload()->warn("[Transport] Navigation to folder '{}' on {} failed: {}", folderId, address_, res.error);
        else if (!res.ok())
            Registry::upload()->warn("[Transport] Navigation to folder '{}' on {} returned HTTP {}", folderId, address_, res.http);
    } catch (const std::exception& e) {
        Registry::upload()->warn("[Transport] Navigation to folder '{}' on {} failed: {}", folderId, address_, e.what());
    }
}

nlohmann::json Transport::upload(const std::filesystem::path& localPath, const std::string& folderId,
                                 const std::string& displayName, const bool injectCover,
                                 const http::ProgressFn& onProgress, const bool navigateFirst) const {
    if (navigateFirst) navigate(folderId);

    // owned_temp removes the repackaged copy on every exit path
    const auto prepared = epub::Repackager::prepare(localPath, injectCover);
    const auto mp = buildMultipart(displayName, util::readFileToString(prepared.upload_path));
    const auto size = mp.data.size();

    const auto base = api::baseUrl(address_);
    const http::Request req{
        .url = api::uploadUrl(address_),
        .headers = {
            "Origin: " + base,
            "Accept: */*",
            "Referer: " + base + "/",
            "Connection: keep-alive",
            fmt::format("Content-Length: {}", size),
            "Content-Type: " + mp.content_type,
        },
        .timeout = uploadTimeout_
    };

    Registry::upload()->info("[Transport] Uploading {} as '{}' ({} bytes, folder='{}')",
                             localPath.string(), displayName, size, folderId);

    const auto res = client_->post(req, mp.data, onProgress);
    const auto context = fmt::format("[file={}, size={}]", displayName, size);

    if (res.transportFailed()) {
        Registry::upload()->error("[Transport] Upload to {} failed: {} (file={}, folder={}, size={})",
                                  address_, res.error, displayName, folderId, size);
        api::throwTransportFailure(res, fmt::format("Upload failed {}", context));
    }

    if (!res.ok()) {
        const auto body = api::truncateBody(res.body);
        Registry::upload()->error("[Transport] Upload HTTP {}: {} (file={}, folder={}, size={})",
                                  res.http, body, displayName, folderId, size);
        throw ProtocolError(res.http, fmt::format("Upload failed (HTTP {}): {} {}", res.http,
                                                  body.empty() ? "no details" : body, context));
    }

    if (res.body.empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(res.http, fmt::format("Upload succeeded but response is not JSON ({}) {}", e.what(), context));
    }
}
