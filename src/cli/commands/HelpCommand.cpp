#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "core/Constants.hpp"

namespace chuck {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "Name:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << opt << " :  " << desc << "\n\n";
        }
    }
}

}

void HelpCommand::printOverview(std::ostream& out) {
    out << "usage: " << Constants::PROGRAM_NAME << " [--verbose|-v] [--json] <command> [<args>]\n\n";
    out << "Chuck Norris jokes CLI\n\n";
    out << "Global options:\n";
    out << "  -v, --verbose\tVerbose output\n";
    out << "  --json\tOutput JSON\n";
    out << "  -h, --help\tShow this help\n\n";
    out << "Commands:\n";
    for (const auto& c : CommandFactory::instance().createAll()) {
        out << "  " << c->name() << "\t" << c->description() << "\n";
    }
}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::string topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(*cmd);
            return {};
        }
        std::cerr << "Unknown help topic: " << topic << "\n\n";
    }

    printOverview(std::cout);
    return {};
}

}

