#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ib::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    });
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);   // timeouts from worker threads
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 0L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    std::string error;

    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    bool transportFailed() const { return curl != CURLE_OK; }
    bool timedOut() const { return curl == CURLE_OPERATION_TIMEDOUT; }
};

inline size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

template <class SetupFn>
static HttpResponse performCurl(SetupFn&& setup) {
    CurlEasy h;                    // RAII handle
    std::string bodyBuf, hdrBuf;
    char errBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    if (r.curl != CURLE_OK) r.error = errBuf[0] ? std::string(errBuf) : std::string(curl_easy_strerror(r.curl));
    return r;
}

}
