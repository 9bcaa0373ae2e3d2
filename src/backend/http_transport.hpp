#pragma once
#include <atomic>
#include <chrono>
#include <string>

namespace crew::backend {

struct HttpResponse {
    bool transport_ok = false;   // False when no HTTP response was received
    bool timed_out = false;
    bool aborted = false;        // Transfer stopped because the abort flag was raised
    long status = 0;
    std::string body;
    std::string error;           // Transport failure description
};

// One HTTP exchange. Implementations must honour the abort flag while a
// transfer is in progress and must not throw.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& json_body,
                                   std::chrono::milliseconds timeout,
                                   const std::atomic<bool>* abort) = 0;
};

} // namespace crew::backend
