#pragma once

#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace chuck {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string url;           // without query string
    QueryParams query;         // raw values, encoded by the transport
    long timeoutSeconds{0};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief Strategy interface for issuing HTTP GET requests
 *
 * Implementations perform exactly one attempt per call. Failures to get
 * any response come back as ErrorCode::Timeout when the time budget was
 * exceeded and ErrorCode::Network otherwise; the message carries the
 * underlying reason. Any HTTP status, including 4xx/5xx, is a success at
 * this level.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual Expected<HttpResponse> get(const HttpRequest& request) = 0;

    /// Transport name for logging (e.g. "curl")
    virtual const char* name() const = 0;
};

}

