#pragma once

#include "cli/ICommand.hpp"

namespace chuck {

class CategoriesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "categories"; }
    const char* description() const override { return "List available joke categories"; }
    const char* helpNameLine() const override { return "categories -  List joke categories"; }
    const char* helpSynopsis() const override { return "chuck [--json] categories"; }
    const char* helpDescription() const override { return "Print every category known to the service, one per line, or as a JSON array with --json."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}

