#include "cli/CommandLine.hpp"

#include <cstddef>
#include <iostream>

#include "api/JokeClient.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "core/Constants.hpp"

namespace chuck {

Expected<ParsedCommandLine> parseCommandLine(const std::vector<std::string>& args) {
    ParsedCommandLine parsed;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--verbose" || arg == "-v") {
            parsed.output.verbose = true;
        } else if (arg == "--json") {
            parsed.output.json = true;
        } else if (arg == "--help" || arg == "-h") {
            parsed.showHelp = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "unrecognized option '" + arg + "'"};
        } else {
            break;
        }
    }

    if (i < args.size()) {
        parsed.command = args[i];
        parsed.commandArgs.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
    }
    return parsed;
}

int runCommandLine(const std::vector<std::string>& args, const JokeClient& client) {
    auto parsed = parseCommandLine(args);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << "\n";
        return Constants::EXIT_HANDLED_ERROR;
    }
    const ParsedCommandLine& cl = parsed.value();

    if (cl.showHelp) {
        HelpCommand::printOverview(std::cout);
        return Constants::EXIT_OK;
    }
    if (cl.command.empty()) {
        HelpCommand::printOverview(std::cerr);
        return Constants::EXIT_NO_COMMAND;
    }

    auto cmd = CommandFactory::instance().create(cl.command);
    if (!cmd) {
        std::cerr << "Unknown command: " << cl.command << "\n";
        HelpCommand::printOverview(std::cerr);
        return Constants::EXIT_NO_COMMAND;
    }

    AppContext ctx{};
    ctx.client = &client;
    ctx.output = cl.output;

    CommandInvoker invoker;
    return CommandInvoker::exitCodeFor(invoker.invoke(*cmd, ctx, cl.commandArgs));
}

}
