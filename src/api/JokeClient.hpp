#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "api/Config.hpp"
#include "api/IHttpTransport.hpp"
#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace chuck {

/**
 * @brief Client for the joke service endpoints
 *
 * Each call issues a single GET through the transport and returns the
 * decoded JSON or an Error. Per-call timeouts override the configured
 * default when positive.
 *
 * Validation strictness differs per endpoint:
 *   - fetchRandom requires an object with a "value" key
 *   - fetchCategories returns whatever decodes
 *   - search trims "result" when it is an array, otherwise passes through
 */
class JokeClient {
public:
    JokeClient(IHttpTransport& transport, ClientConfig config);

    Expected<nlohmann::json> fetchRandom(const std::optional<std::string>& category = std::nullopt,
                                         std::optional<long> timeoutSeconds = std::nullopt) const;

    Expected<nlohmann::json> fetchCategories(std::optional<long> timeoutSeconds = std::nullopt) const;

    Expected<nlohmann::json> search(const std::string& query,
                                    long long limit = Constants::DEFAULT_SEARCH_LIMIT,
                                    std::optional<long> timeoutSeconds = std::nullopt) const;

    /// Keep the first `limit` entries of data["result"] when it is an array.
    static void trimResults(nlohmann::json& data, long long limit);

private:
    Expected<nlohmann::json> getJson(const char* path, QueryParams query, const std::string& action,
                                     std::optional<long> timeoutSeconds) const;

    IHttpTransport& transport;
    ClientConfig cfg;
};

}

