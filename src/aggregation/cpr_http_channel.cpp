// QuickRoute - cpr HTTP Channel

#include <quickroute/aggregation/http_channel.hpp>
#include <quickroute/errors.hpp>
#include <cpr/cpr.h>

namespace quickroute::aggregation {

HttpResponse CprHttpChannel::send(const std::string& source, const HttpRequest& request,
                                  std::chrono::milliseconds timeout) {
    cpr::Header header{{"Accept", "application/json"}};
    for (const auto& [key, value] : request.headers) {
        header[key] = value;
    }

    cpr::Response r;
    if (request.body.empty()) {
        r = cpr::Get(cpr::Url{request.url}, header, cpr::Timeout{timeout});
    } else {
        header["Content-Type"] = "application/json";
        r = cpr::Post(cpr::Url{request.url}, header, cpr::Body{request.body}, cpr::Timeout{timeout});
    }

    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        throw SourceTimeout(source, "request timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (r.error) {
        throw TransportError(source, "HTTP request failed: " + r.error.message);
    }

    return HttpResponse{r.status_code, r.text, r.elapsed * 1000.0};
}

}  // namespace quickroute::aggregation
