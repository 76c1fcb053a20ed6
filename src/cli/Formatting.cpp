#include "cli/Formatting.hpp"

#include <optional>
#include <string>

#include "core/Joke.hpp"
#include "util/StringUtils.hpp"

namespace chuck {

namespace Formatting {

namespace {

constexpr const char* MISSING_FIELD = "(none)";

/// Strings print as-is, other JSON values in compact form; nullopt when absent.
std::optional<std::string> fieldText(const nlohmann::json& data, const char* key) {
    if (!data.is_object()) return std::nullopt;
    auto it = data.find(key);
    if (it == data.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}

void printJson(std::ostream& out, const nlohmann::json& data) {
    out << data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

/**
 * Text form:
 *   ID: <id>                 (verbose only, "(none)" when absent)
 *   URL: <url>               (verbose only, "(none)" when absent)
 *   Categories: a, b         (verbose, when non-empty)
 *                            (verbose only)
 *   <joke text>
 */
void printJoke(std::ostream& out, const nlohmann::json& data, const OutputOptions& opts) {
    if (opts.json) {
        printJson(out, data);
        return;
    }

    if (opts.verbose) {
        Joke joke = Joke::fromJson(data);
        out << "ID: " << fieldText(data, "id").value_or(MISSING_FIELD) << "\n";
        out << "URL: " << fieldText(data, "url").value_or(MISSING_FIELD) << "\n";
        if (!joke.categories.empty()) {
            out << "Categories: " << StringUtils::join(joke.categories, ", ") << "\n";
        }
        out << "\n";
    }

    out << fieldText(data, "value").value_or("(no joke returned)") << "\n";
}

void printCategories(std::ostream& out, const nlohmann::json& categories, const OutputOptions& opts) {
    if (opts.json) {
        printJson(out, categories);
        return;
    }
    if (!categories.is_array()) return;

    for (const auto& c : categories) {
        if (c.is_string()) {
            out << c.get<std::string>() << "\n";
        } else {
            out << c.dump() << "\n";
        }
    }
}

void printSearchResults(std::ostream& out, const nlohmann::json& data, const OutputOptions& opts) {
    if (opts.json) {
        printJson(out, data);
        return;
    }

    // Missing or malformed "result" reads as no matches
    SearchResult results = SearchResult::fromJson(data);
    if (results.result.empty()) {
        out << "No jokes found.\n";
        return;
    }

    size_t idx = 1;
    for (const auto& joke : results.result) {
        out << idx++ << ". " << joke.value << "\n";
        if (opts.verbose) {
            out << "   id: " << joke.id << "\n";
            if (!joke.categories.empty()) {
                out << "   categories: " << StringUtils::join(joke.categories, ", ") << "\n";
            }
        }
    }
}

}

}
