#include "http/Client.hpp"
#include "log/Registry.hpp"

#include <cstdio>
#include <cstring>
#include <exception>

using namespace ib::http;
using namespace ib::util;

namespace {

struct ReadCtx {
    const char* data{nullptr};
    size_t size{0};
    size_t off{0};
    const ProgressFn* progress{nullptr};
};

void applyCommon(CURL* h, const Request& req, const SList& hdrs) {
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(req.timeout.count()));
    if (hdrs.get()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
}

}

CurlClient::CurlClient() { ensureCurlGlobalInit(); }

HttpResponse CurlClient::get(const Request& req) {
    SList hdrs;
    for (const auto& h : req.headers) hdrs.add(h);

    return performCurl([&](CURL* h) {
        applyCommon(h, req, hdrs);
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });
}

HttpResponse CurlClient::post(const Request& req, const std::string& body, const ProgressFn& onProgress) {
    SList hdrs;
    for (const auto& h : req.headers) hdrs.add(h);
    // avoid Expect: 100-continue stalls, the device never answers it
    hdrs.add("Expect:");

    ReadCtx ctx{ body.data(), body.size(), 0, onProgress ? &onProgress : nullptr };

    return performCurl([&](CURL* h) {
        applyCommon(h, req, hdrs);
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(ctx.size));
        curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* out, size_t size, size_t nmemb, void* userdata) -> size_t {
                auto* c = static_cast<ReadCtx*>(userdata);
                if (!c || !c->data) return 0;

                const size_t max_bytes = size * nmemb;
                const size_t remaining = (c->off < c->size) ? (c->size - c->off) : 0;
                const size_t to_copy = (remaining < max_bytes) ? remaining : max_bytes;

                if (to_copy) {
                    std::memcpy(out, c->data + c->off, to_copy);
                    c->off += to_copy;
                }

                if (c->progress && c->size) {
                    try {
                        (*c->progress)(static_cast<double>(c->off) / static_cast<double>(c->size));
                    } catch (const std::exception& e) {
                        ib::log::Registry::upload()->error("[CurlClient] Progress callback failed: {}", e.what());
                        return CURL_READFUNC_ABORT;
                    }
                }
                return to_copy; // 0 signals EOF
            });

        // Support rewinds (auth retries, redirects)
        curl_easy_setopt(h, CURLOPT_SEEKDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_SEEKFUNCTION,
            +[](void* userdata, curl_off_t offset, int origin) -> int {
                auto* c = static_cast<ReadCtx*>(userdata);
                if (!c || origin != SEEK_SET || offset < 0) return CURL_SEEKFUNC_CANTSEEK;
                const auto off = static_cast<size_t>(offset);
                if (off > c->size) return CURL_SEEKFUNC_CANTSEEK;
                c->off = off;
                return CURL_SEEKFUNC_OK;
            });
    });
}
