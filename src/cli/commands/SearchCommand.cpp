#include "cli/commands/SearchCommand.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

#include "api/JokeClient.hpp"
#include "cli/Formatting.hpp"
#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace chuck {

static Expected<long long> parseLimit(const std::string& text) {
    long long value = 0;
    size_t pos = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::invalid_argument&) {
        return Error{ErrorCode::InvalidArgs, "search: invalid --limit value '" + text + "'"};
    } catch (const std::out_of_range&) {
        return Error{ErrorCode::InvalidArgs, "search: --limit value out of range '" + text + "'"};
    }
    if (pos != text.size()) {
        return Error{ErrorCode::InvalidArgs, "search: invalid --limit value '" + text + "'"};
    }
    if (value < 0) {
        return Error{ErrorCode::InvalidArgs, "search: --limit must not be negative"};
    }
    return value;
}

/**
 * @brief Execute 'chuck search' command
 *
 * Supports:
 *   <query>                 : required, exactly one positional
 *   -n <n>, --limit <n>     : maximum number of jokes shown (default 10)
 *   --limit=<n>
 *   --                      : everything after is positional
 *
 * A query that is empty after trimming is rejected before any request.
 */
Expected<void> SearchCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::optional<std::string> query;
    long long limit = Constants::DEFAULT_SEARCH_LIMIT;
    bool optionsDone = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool looksLikeOption = !optionsDone && arg.size() > 1 && arg[0] == '-';

        if (!looksLikeOption) {
            if (query) {
                return Error{ErrorCode::InvalidArgs, "search: unexpected extra argument '" + arg + "'"};
            }
            query = arg;
        } else if (arg == "--") {
            optionsDone = true;
        } else if (arg == "--limit" || arg == "-n") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "search: option " + arg + " requires a value"};
            }
            auto parsed = parseLimit(args[++i]);
            if (!parsed) return parsed.error();
            limit = parsed.value();
        } else if (StringUtils::startsWith(arg, "--limit=")) {
            auto parsed = parseLimit(arg.substr(std::string("--limit=").size()));
            if (!parsed) return parsed.error();
            limit = parsed.value();
        } else {
            return Error{ErrorCode::InvalidArgs, "search: unrecognized argument '" + arg + "'"};
        }
    }

    if (!query) {
        return Error{ErrorCode::InvalidArgs, "search: missing <query> argument"};
    }
    if (StringUtils::trim(*query).empty()) {
        return Error{ErrorCode::EmptyQuery, "search query cannot be empty"};
    }
    if (!ctx.client) {
        return Error{ErrorCode::InternalError, "search: no API client configured"};
    }

    auto res = ctx.client->search(*query, limit);
    if (!res) {
        return Error{res.error().code, "failed to search jokes - " + res.error().message};
    }

    Formatting::printSearchResults(std::cout, res.value(), ctx.output);
    return {};
}

}
