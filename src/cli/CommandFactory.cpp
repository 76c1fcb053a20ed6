#include "cli/CommandFactory.hpp"

#include "cli/commands/CategoriesCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/RandomCommand.hpp"
#include "cli/commands/SearchCommand.hpp"

namespace chuck {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

bool CommandFactory::contains(const std::string& name) const {
    return creators.find(name) != creators.end();
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

std::vector<std::unique_ptr<ICommand>> CommandFactory::createAll() const {
    // std::map keeps names ordered
    std::vector<std::unique_ptr<ICommand>> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    return out;
}

void registerBuiltinCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("random", [] { return std::make_unique<RandomCommand>(); });
    f.registerCreator("categories", [] { return std::make_unique<CategoriesCommand>(); });
    f.registerCreator("search", [] { return std::make_unique<SearchCommand>(); });
}

}

