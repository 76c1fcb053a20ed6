// chuck: fetch and display jokes from the chucknorris.io service.

#include <string>
#include <vector>

#include "api/Config.hpp"
#include "api/CurlTransport.hpp"
#include "api/JokeClient.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandLine.hpp"
#include "core/Constants.hpp"

using namespace chuck;

int main(int argc, char** argv) {
    CurlGlobal curl;
    if (!curl.ok()) return Constants::EXIT_HANDLED_ERROR;

    registerBuiltinCommands();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    CurlTransport transport;
    JokeClient client(transport, loadClientConfig());
    return runCommandLine(args, client);
}
