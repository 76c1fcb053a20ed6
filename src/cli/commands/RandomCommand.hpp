#pragma once

#include "cli/ICommand.hpp"

namespace chuck {

class RandomCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "random"; }
    const char* description() const override { return "Get a single random joke"; }
    const char* helpNameLine() const override { return "random -  Fetch one random joke"; }
    const char* helpSynopsis() const override { return "chuck [--verbose] [--json] random [--category <name>]"; }
    const char* helpDescription() const override { return "Fetch a random joke, optionally restricted to one category. With --verbose the joke id, URL and categories are printed above the text."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-c, --category <name>", "Category to fetch a random joke from."} };
    }
};

}

