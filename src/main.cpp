#include <iostream>
#include <vector>
#include <string>
#include "cli/ansi.hpp"
#include "cli/bootstrap.hpp"
#include "cli/prompts.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "net/server_api.hpp"
#include "session/session.hpp"
#include "themes/theme_registry.hpp"
#include <fmt/format.h>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        ZulipServerApi api;
        BootstrapIO io{std::cout, std::cerr, styled_input, read_password};
        SessionBootstrap bootstrap(api, remote_session_factory(api, std::cout),
                                   builtin_themes(), io);
        return bootstrap.run(args);
    } catch (const std::exception& e) {
        zt_log(std::string("Unhandled exception: ") + e.what());
        std::cout << ansi::red(fmt::format(
                         "\nZulip Terminal has crashed!\n"
                         "Please refer to {} for reporting this bug.", BUG_REPORT_URL))
                  << "\n";
        return 1;
    }
}
