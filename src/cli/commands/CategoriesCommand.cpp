#include "cli/commands/CategoriesCommand.hpp"

#include <iostream>

#include "api/JokeClient.hpp"
#include "cli/Formatting.hpp"

namespace chuck {

Expected<void> CategoriesCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "categories: unrecognized argument '" + args.front() + "'"};
    }
    if (!ctx.client) {
        return Error{ErrorCode::InternalError, "categories: no API client configured"};
    }

    auto res = ctx.client->fetchCategories();
    if (!res) {
        return Error{res.error().code, "failed to fetch categories - " + res.error().message};
    }

    Formatting::printCategories(std::cout, res.value(), ctx.output);
    return {};
}

}
