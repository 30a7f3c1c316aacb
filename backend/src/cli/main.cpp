#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "Commands.hpp"

static const char* kVersion = "0.3.0";

void printUsage() {
    std::cout << "Usage: hidemail <command> [options]\n\n"
        "Commands:\n"
        "  setup                 Store your Apple ID credentials and sign in\n"
        "  login  [-u ACCOUNT]   Sign in with the stored credentials\n"
        "  logout [-u ACCOUNT]   Remove stored credentials and session data\n"
        "         [-y]           Do not ask for confirmation\n"
        "  status                Show authentication status\n\n"
        "Options:\n"
        "  -h, --help            Show this message\n"
        "  --version             Show the version\n\n"
        "State lives in $HIDEMAIL_HOME (default ~/.hidemail); settings are read\n"
        "from its 'config' file as 'key = value' lines.\n\n"
        "Signing in needs a remote helper that speaks to the account service.\n"
        "hidemail runs 'hidemail-remote' from PATH unless the config sets\n"
        "  remote_helper = /path/to/helper\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() || args[0] == "-h" || args[0] == "--help" || args[0] == "help") {
        printUsage();
        return args.empty() ? 1 : 0;
    }
    if (args[0] == "--version") {
        std::cout << "hidemail " << kVersion << "\n";
        return 0;
    }

    std::string command = args[0];
    if (command != "setup" && command != "login" && command != "logout" && command != "status") {
        std::cerr << "Unknown command '" << command << "'\n";
        printUsage();
        return 2;
    }

    std::optional<std::string> username;
    bool assumeYes = false;

    for (size_t i = 1; i < args.size(); ++i) {
        if ((args[i] == "-u" || args[i] == "--username") && i + 1 < args.size()) {
            username = args[++i];
        }
        else if (args[i] == "-y" || args[i] == "--yes") {
            assumeYes = true;
        }
        else {
            std::cerr << "Unknown option '" << args[i] << "'\n";
            printUsage();
            return 2;
        }
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    try {
        Paths paths = Paths::resolve();
        paths.ensureRoot();

        Log::init(paths.logFile.string(), Settings::load(paths.configFile).logLevel());
        spdlog::info("hidemail {} running '{}'", kVersion, command);

        App app = App::create(paths);

        if (command == "setup")  return runSetup(app);
        if (command == "login")  return runLogin(app, username);
        if (command == "logout") return runLogout(app, username, assumeYes);
        return runStatus(app);
    }
    catch (const HideMailError& e) {
        std::cerr << "Error [" << kindName(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
