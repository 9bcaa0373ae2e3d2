#pragma once
#include "backend/http_transport.hpp"

namespace crew::backend {

// libcurl-backed transport. A fresh easy handle per exchange keeps it safe
// to share across worker threads.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    HttpResponse post_json(const std::string& url,
                           const std::string& json_body,
                           std::chrono::milliseconds timeout,
                           const std::atomic<bool>* abort) override;
};

} // namespace crew::backend
