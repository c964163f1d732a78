#include "messaging/Sockets.hh"
#include "main/Config.hh"
#include "main/WizardMain.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

using namespace Wizard;
using Main::WizardMain;

class WizardApp {
public:

    WizardApp(
        Messaging::MessageContext& zmqctx,
        const std::string& configPath) :
        app {zmqctx, Main::configFromPath(configPath)}
    {
        log(LogLevel::INFO, "Startup completed");
    }

    ~WizardApp()
    {
        log(LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        app.run();
    }

private:

    WizardMain app;
};

std::string parseArgs(int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { "verbose", no_argument, 0, 'v' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else {
            std::cerr << "Usage: " << argv[0] << " [-v]... [-f CONFIG]\n";
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);

    return configPath;
}

}

int wizard_main(int argc, char* argv[])
{
    const auto config_path = parseArgs(argc, argv);
    Messaging::MessageContext zmqctx;
    WizardApp app {zmqctx, config_path};
    app.run();
    return EXIT_SUCCESS;
}
