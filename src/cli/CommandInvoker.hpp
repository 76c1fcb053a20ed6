#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace chuck {

/**
 * @brief Runs a command and reports its failure
 *
 * A failed command produces exactly one "Error: <message>" line on
 * stderr; the returned Expected still carries the error for exit-code
 * mapping.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// 0 on success, 2 for any handled failure.
    static int exitCodeFor(const Expected<void>& result);
};

}

