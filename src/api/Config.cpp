#include "api/Config.hpp"

#include <cerrno>
#include <cstdlib>

#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace chuck {

static bool parsePositiveSeconds(const std::string& text, long& out) {
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(trimmed.c_str(), &end, 10);
    if (errno != 0 || end == trimmed.c_str() || *end != '\0' || v <= 0) return false;
    out = v;
    return true;
}

ClientConfig loadClientConfig() {
    ClientConfig cfg;

    const char* base = std::getenv(Constants::ENV_BASE_URL);
    if (base && *base) {
        std::string url(base);
        while (!url.empty() && url.back() == '/') url.pop_back();
        if (!url.empty()) cfg.baseUrl = url;
    }

    const char* timeout = std::getenv(Constants::ENV_TIMEOUT);
    if (timeout && *timeout) {
        long seconds = 0;
        if (parsePositiveSeconds(timeout, seconds)) {
            cfg.timeoutSeconds = seconds;
        } else {
            Logger::instance().warn(std::string("Ignoring invalid ") + Constants::ENV_TIMEOUT + "='" + timeout
                + "', using " + std::to_string(Constants::DEFAULT_TIMEOUT_SECONDS) + "s");
        }
    }

    Logger::instance().debug("Config: base=" + cfg.baseUrl + " timeout=" + std::to_string(cfg.timeoutSeconds) + "s");
    return cfg;
}

}
