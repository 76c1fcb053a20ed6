#include "cli/CommandInvoker.hpp"

#include <iostream>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace chuck {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().debug(std::string(cmd.name()) + " failed (" + errorCodeName(res.error().code) + ")");
        std::cerr << "Error: " << res.error().message << "\n";
        return res;
    }
    return {};
}

int CommandInvoker::exitCodeFor(const Expected<void>& result) {
    return result ? Constants::EXIT_OK : Constants::EXIT_HANDLED_ERROR;
}

}

