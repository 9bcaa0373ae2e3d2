#include "backend/curl_transport.hpp"
#include <curl/curl.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace crew::backend {

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* abort = static_cast<const std::atomic<bool>*>(clientp);
    return (abort && abort->load()) ? 1 : 0;
}

struct CurlHandle {
    CURL* h{nullptr};
    curl_slist* headers{nullptr};
    CurlHandle() : h(curl_easy_init()) {}
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::once_flag g_curl_init;

} // namespace

CurlTransport::CurlTransport() {
    std::call_once(g_curl_init, [] {
        CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(code));
        }
    });
}

HttpResponse CurlTransport::post_json(const std::string& url,
                                      const std::string& json_body,
                                      std::chrono::milliseconds timeout,
                                      const std::atomic<bool>* abort) {
    HttpResponse resp;
    if (abort && abort->load()) {
        resp.aborted = true;
        resp.error = "aborted before transfer";
        return resp;
    }

    CurlHandle c;
    if (!c.h) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    std::string buf;

    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(abort));

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        resp.error = curl_easy_strerror(code);
        resp.timed_out = (code == CURLE_OPERATION_TIMEDOUT);
        resp.aborted = (code == CURLE_ABORTED_BY_CALLBACK);
        spdlog::debug("POST {} failed: {}", url, resp.error);
        return resp;
    }

    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.transport_ok = true;
    resp.body = std::move(buf);
    return resp;
}

} // namespace crew::backend
