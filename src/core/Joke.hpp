#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chuck {

/**
 * @brief One joke as returned by the upstream service
 *
 * Built from decoded JSON with default substitution for anything
 * missing or of the wrong type; never fails.
 */
struct Joke {
    std::string id;
    std::string value;
    std::optional<std::string> url;
    std::optional<std::string> iconUrl;
    std::vector<std::string> categories;

    static Joke fromJson(const nlohmann::json& data);
};

/**
 * @brief Search response: the server-side total and the (possibly
 * client-trimmed) list of matching jokes
 */
struct SearchResult {
    long long total{0};
    std::vector<Joke> result;

    static SearchResult fromJson(const nlohmann::json& data);
};

}

