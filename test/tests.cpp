#include "datadrift/Log.hpp"

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

int main(int argc, char* argv[]) {
    using namespace Catch::clara;

    Catch::Session session;
    bool show_logging = false;

    auto cli = session.cli()
        | Opt(show_logging)
             ["--show-log"]
             ("Show DataDrift log output");

    session.cli(cli);

    auto ret = session.applyCommandLine(argc, argv);
    if (ret) {
        return ret;
    }
    datadrift::setLogLevel(show_logging ? 2 : 0);

    return session.run();
}
