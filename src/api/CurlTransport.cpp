#include "api/CurlTransport.hpp"

#include <memory>
#include <optional>

#include <curl/curl.h>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace chuck {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total);
    return total;
}

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

struct CurlStringDeleter {
    void operator()(char* s) const { curl_free(s); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

std::optional<std::string> escape(CURL* h, const std::string& raw) {
    CurlString enc(curl_easy_escape(h, raw.c_str(), static_cast<int>(raw.size())));
    if (!enc) return std::nullopt;
    return std::string(enc.get());
}

/// Append percent-encoded query parameters to url; nullopt if encoding fails.
std::optional<std::string> buildUrl(CURL* h, const std::string& url, const QueryParams& query) {
    std::string out = url;
    char sep = (url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : query) {
        auto encKey = escape(h, key);
        auto encValue = escape(h, value);
        if (!encKey || !encValue) return std::nullopt;
        out += sep;
        out += *encKey;
        out += '=';
        out += *encValue;
        sep = '&';
    }
    return out;
}

}

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    initialized = (rc == CURLE_OK);
    if (!initialized) {
        Logger::instance().error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    if (initialized) curl_global_cleanup();
}

CurlTransport::CurlTransport()
    : userAgent(std::string(Constants::PROGRAM_NAME) + "/" + Constants::VERSION) {}

Expected<HttpResponse> CurlTransport::get(const HttpRequest& request) {
    EasyHandle h(curl_easy_init());
    if (!h) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    auto built = buildUrl(h.get(), request.url, request.query);
    if (!built) {
        return Error{ErrorCode::InternalError, "could not encode query parameters for " + request.url};
    }
    const std::string& url = *built;
    HttpResponse response;

    HeaderList headers(curl_slist_append(nullptr, "Accept: application/json"));

    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h.get(), CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h.get(), CURLOPT_ACCEPT_ENCODING, "");
    if (request.timeoutSeconds > 0) {
        curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, request.timeoutSeconds);
    }

    Logger::instance().debug("GET " + url);
    CURLcode res = curl_easy_perform(h.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error{ErrorCode::Timeout, curl_easy_strerror(res)};
    }
    if (res != CURLE_OK) {
        return Error{ErrorCode::Network, curl_easy_strerror(res)};
    }

    res = curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (res != CURLE_OK) {
        return Error{ErrorCode::InternalError, std::string("could not read response status: ") + curl_easy_strerror(res)};
    }
    Logger::instance().debug("HTTP " + std::to_string(response.status) + " (" + std::to_string(response.body.size()) + " bytes)");
    return response;
}

}
