#pragma once

#include "cli/ICommand.hpp"

namespace chuck {

class SearchCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "search"; }
    const char* description() const override { return "Search jokes by query"; }
    const char* helpNameLine() const override { return "search -  Search jokes by free text"; }
    const char* helpSynopsis() const override { return "chuck [--verbose] [--json] search <query> [--limit <n>]"; }
    const char* helpDescription() const override { return "Search the service for jokes containing <query> and print a numbered list of at most <n> matches (default 10)."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-n, --limit <n>", "Limit number of results (default 10)."} };
    }
};

}

