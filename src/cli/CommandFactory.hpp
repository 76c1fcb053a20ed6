#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace chuck {

/**
 * @brief Registry mapping subcommand names to command creators
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One fresh instance of every registered command, sorted by name.
    std::vector<std::unique_ptr<ICommand>> createAll() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

/// Register help, random, categories and search. Safe to call repeatedly.
void registerBuiltinCommands();

}

