#include "cli/commands/RandomCommand.hpp"

#include <iostream>
#include <optional>

#include "api/JokeClient.hpp"
#include "cli/Formatting.hpp"
#include "util/StringUtils.hpp"

namespace chuck {

/**
 * @brief Execute 'chuck random' command
 *
 * Supports:
 *   -c <name>, --category <name>, --category=<name>
 *
 * An empty category is the same as none: the request carries no
 * category parameter.
 */
Expected<void> RandomCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::optional<std::string> category;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--category" || arg == "-c") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "random: option " + arg + " requires a value"};
            }
            category = args[++i];
        } else if (StringUtils::startsWith(arg, "--category=")) {
            category = arg.substr(std::string("--category=").size());
        } else {
            return Error{ErrorCode::InvalidArgs, "random: unrecognized argument '" + arg + "'"};
        }
    }

    if (!ctx.client) {
        return Error{ErrorCode::InternalError, "random: no API client configured"};
    }

    auto res = ctx.client->fetchRandom(category);
    if (!res) {
        return Error{res.error().code, "failed to fetch random joke - " + res.error().message};
    }

    Formatting::printJoke(std::cout, res.value(), ctx.output);
    return {};
}

}
