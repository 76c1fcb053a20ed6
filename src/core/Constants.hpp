#pragma once

#include <cstddef>

/**
 * @brief Constants used throughout the codebase
 *
 * Centralizes defaults and exit codes so commands and the client agree.
 */
namespace chuck {

namespace Constants {
    constexpr const char* VERSION = "0.1.0";
    constexpr const char* PROGRAM_NAME = "chuck";

    // Upstream service
    constexpr const char* DEFAULT_BASE_URL = "https://api.chucknorris.io";
    constexpr long DEFAULT_TIMEOUT_SECONDS = 10;
    constexpr long long DEFAULT_SEARCH_LIMIT = 10;

    // Environment variables
    constexpr const char* ENV_BASE_URL = "CHUCK_API_BASE_URL";
    constexpr const char* ENV_TIMEOUT = "CHUCK_CLI_TIMEOUT";

    // Endpoint paths, relative to the base URL
    constexpr const char* PATH_RANDOM = "/jokes/random";
    constexpr const char* PATH_CATEGORIES = "/jokes/categories";
    constexpr const char* PATH_SEARCH = "/jokes/search";

    // Process exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_NO_COMMAND = 1;     // no subcommand resolved to a handler
    constexpr int EXIT_HANDLED_ERROR = 2;  // bad arguments or failed request
}
}

