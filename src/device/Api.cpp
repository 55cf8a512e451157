#include "device/Api.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

using namespace ib::device;

std::string api::baseUrl(const std::string& address) {
    return "http://" + address;
}

std::string api::documentsUrl(const std::string& address, const std::string& folderId) {
    return baseUrl(address) + "/documents/" + folderId;
}

std::string api::uploadUrl(const std::string& address) {
    return baseUrl(address) + "/upload";
}

ib::http::Request api::listingRequest(const std::string& address, const std::string& folderId,
                                      const std::chrono::milliseconds timeout) {
    return {
        .url = documentsUrl(address, folderId),
        .headers = {"Content-Type: application/json", "charset: ISO-8859-1"},
        .timeout = timeout
    };
}

std::string api::truncateBody(const std::string& body, const size_t max) {
    if (body.size() <= max) return body;
    return body.substr(0, max) + "...";
}

void api::throwTransportFailure(const util::HttpResponse& r, const std::string& context) {
    if (r.timedOut()) throw TimeoutError(fmt::format("{}: timed out ({})", context, r.error));
    throw ConnectivityError(fmt::format("{}: {}", context, r.error));
}
