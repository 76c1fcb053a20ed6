#pragma once

#include <string>

#include "api/IHttpTransport.hpp"

namespace chuck {

/**
 * @brief RAII guard for curl_global_init / curl_global_cleanup
 *
 * Create exactly one in main() before any CurlTransport is used.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return initialized; }

private:
    bool initialized{false};
};

/// libcurl easy-interface transport, one handle per request.
class CurlTransport : public IHttpTransport {
public:
    CurlTransport();

    Expected<HttpResponse> get(const HttpRequest& request) override;
    const char* name() const override { return "curl"; }

private:
    std::string userAgent;
};

}

