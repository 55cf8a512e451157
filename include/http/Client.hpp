#pragma once

#include "util/curlWrappers.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace ib::http {

using ProgressFn = std::function<void(double fraction)>;

struct Request {
    std::string url;
    std::vector<std::string> headers{};     // "Name: value"
    std::chrono::milliseconds timeout{10000};
};

/**
 * Minimal HTTP seam used by everything that talks to the tablet.
 * Implementations never throw on HTTP-level failures; the outcome is
 * reported through the returned response (curl code + status).
 */
class Client {
public:
    virtual ~Client() = default;

    virtual util::HttpResponse get(const Request& req) = 0;

    /// Streams `body` as the request payload; `onProgress` receives the
    /// fraction of body bytes handed to the transport so far.
    virtual util::HttpResponse post(const Request& req, const std::string& body,
                                    const ProgressFn& onProgress) = 0;
};

class CurlClient final : public Client {
public:
    CurlClient();

    util::HttpResponse get(const Request& req) override;
    util::HttpResponse post(const Request& req, const std::string& body,
                            const ProgressFn& onProgress) override;
};

}
