#pragma once

#include "http/Client.hpp"

#include <chrono>
#include <string>

namespace ib::device::api {

inline constexpr size_t MAX_ERROR_BODY = 512;

std::string baseUrl(const std::string& address);
std::string documentsUrl(const std::string& address, const std::string& folderId);
std::string uploadUrl(const std::string& address);

// GET /documents/{id}; also moves the device's "current directory" to that folder.
http::Request listingRequest(const std::string& address, const std::string& folderId,
                             std::chrono::milliseconds timeout);

std::string truncateBody(const std::string& body, size_t max = MAX_ERROR_BODY);

// Throws TimeoutError or ConnectivityError for a response whose transport failed.
[[noreturn]] void throwTransportFailure(const util::HttpResponse& r, const std::string& context);

}
