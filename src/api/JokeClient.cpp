#include "api/JokeClient.hpp"

#include <cstddef>
#include <utility>

#include "util/Logger.hpp"

namespace chuck {

JokeClient::JokeClient(IHttpTransport& transport, ClientConfig config)
    : transport(transport), cfg(std::move(config)) {}

/**
 * @brief Shared GET + decode path
 *
 * Maps transport failures and non-2xx statuses to errors mentioning the
 * action (e.g. "fetching random joke"), then decodes the body without
 * throwing.
 */
Expected<nlohmann::json> JokeClient::getJson(const char* path, QueryParams query, const std::string& action,
                                             std::optional<long> timeoutSeconds) const {
    HttpRequest req;
    req.url = cfg.baseUrl + path;
    req.query = std::move(query);
    req.timeoutSeconds = (timeoutSeconds && *timeoutSeconds > 0) ? *timeoutSeconds : cfg.timeoutSeconds;

    auto res = transport.get(req);
    if (!res) {
        const Error& err = res.error();
        Logger::instance().debug(std::string(transport.name()) + " " + errorCodeName(err.code) + ": " + err.message);
        if (err.code == ErrorCode::Timeout) {
            return Error{ErrorCode::Timeout, "Request timed out while " + action};
        }
        if (err.code == ErrorCode::Network) {
            return Error{ErrorCode::Network, "Network error while " + action + ": " + err.message};
        }
        return err;
    }

    const HttpResponse& resp = res.value();
    if (resp.status < 200 || resp.status >= 300) {
        return Error{ErrorCode::HttpStatus, "HTTP " + std::to_string(resp.status) + " while " + action};
    }

    nlohmann::json data = nlohmann::json::parse(resp.body, nullptr, false);
    if (data.is_discarded()) {
        return Error{ErrorCode::InvalidJson, "Invalid JSON received from API"};
    }
    return data;
}

Expected<nlohmann::json> JokeClient::fetchRandom(const std::optional<std::string>& category,
                                                 std::optional<long> timeoutSeconds) const {
    QueryParams query;
    if (category && !category->empty()) {
        query.emplace_back("category", *category);
    }

    auto res = getJson(Constants::PATH_RANDOM, std::move(query), "fetching random joke", timeoutSeconds);
    if (!res) return res;

    const nlohmann::json& data = res.value();
    if (!data.is_object() || !data.contains("value")) {
        return Error{ErrorCode::UnexpectedShape, "API returned unexpected response shape"};
    }
    return res;
}

Expected<nlohmann::json> JokeClient::fetchCategories(std::optional<long> timeoutSeconds) const {
    return getJson(Constants::PATH_CATEGORIES, {}, "fetching categories", timeoutSeconds);
}

Expected<nlohmann::json> JokeClient::search(const std::string& query, long long limit,
                                            std::optional<long> timeoutSeconds) const {
    auto res = getJson(Constants::PATH_SEARCH, {{"query", query}}, "searching jokes", timeoutSeconds);
    if (!res) return res;

    trimResults(res.value(), limit);
    return res;
}

void JokeClient::trimResults(nlohmann::json& data, long long limit) {
    if (!data.is_object()) return;
    auto it = data.find("result");
    if (it == data.end() || !it->is_array()) return;

    size_t keep = limit > 0 ? static_cast<size_t>(limit) : 0;
    if (it->size() > keep) {
        it->erase(it->begin() + static_cast<std::ptrdiff_t>(keep), it->end());
    }
}

}
