#pragma once

#include <string>

#include "core/Constants.hpp"

namespace chuck {

/**
 * @brief Client settings, loaded once at start-up and passed to JokeClient
 */
struct ClientConfig {
    std::string baseUrl{Constants::DEFAULT_BASE_URL};
    long timeoutSeconds{Constants::DEFAULT_TIMEOUT_SECONDS};
};

/**
 * @brief Build a ClientConfig from CHUCK_API_BASE_URL and CHUCK_CLI_TIMEOUT
 *
 * Unset or empty variables keep the defaults. A trailing '/' on the base
 * URL is dropped. A timeout that is not a positive integer is logged as a
 * warning and replaced by the default.
 */
ClientConfig loadClientConfig();

}

