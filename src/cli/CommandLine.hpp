#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace chuck {

class JokeClient;

/// Global flags plus the subcommand and its own arguments.
struct ParsedCommandLine {
    OutputOptions output;
    bool showHelp{false};
    std::string command;               // empty when none was given
    std::vector<std::string> commandArgs;
};

/**
 * @brief Split argv (without program name) into global flags and command
 *
 * Global flags are only recognized before the subcommand name.
 */
Expected<ParsedCommandLine> parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Parse, dispatch to one command, and map the outcome to an exit code
 *
 * Returns 0 on success, 2 for a handled failure (bad arguments or a
 * failed request) and 1 when no subcommand resolves to a handler.
 * Commands must already be registered with CommandFactory.
 */
int runCommandLine(const std::vector<std::string>& args, const JokeClient& client);

}

