// QuickRoute - HTTP Channel
// Request/response transport used by source adapters

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace quickroute::aggregation {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;   // non-empty switches the request to POST
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    double elapsed_ms = 0.0;
};

class HttpChannel {
public:
    virtual ~HttpChannel() = default;

    /// Throws SourceTimeout when the deadline passes and TransportError when
    /// no response arrives. HTTP error statuses are returned, not thrown.
    virtual HttpResponse send(const std::string& source, const HttpRequest& request,
                              std::chrono::milliseconds timeout) = 0;
};

// libcurl-backed channel
class CprHttpChannel : public HttpChannel {
public:
    HttpResponse send(const std::string& source, const HttpRequest& request,
                      std::chrono::milliseconds timeout) override;
};

}  // namespace quickroute::aggregation
