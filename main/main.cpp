// Console stand-in for the CAD host: raises document events from stdin so the
// plugin can be driven against a real managed drive.

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "host/DocumentEvents.hpp"
#include "lock/LocalDriveClient.hpp"
#include "notify/ConsoleSink.hpp"
#include "plugin/Plugin.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

using namespace dl;

namespace {

void printUsage() {
    std::cout << "Commands:\n"
                 "  open <path>       open a model document\n"
                 "  import <path>     import a file into the active model\n"
                 "  close <path>      close a model document (no path: never saved)\n"
                 "  gh-open <path>    open a companion document\n"
                 "  gh-close <path>   close a companion document\n"
                 "  reopen-log        reopen the log file after rotation\n"
                 "  help | quit\n";
}

std::string restOfLine(std::istringstream& in) {
    std::string rest;
    std::getline(in >> std::ws, rest);
    return rest;
}

}

int main(const int argc, char** argv) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : config::ConfigRegistry::DEFAULT_CONFIG_PATH;

    try {
        if (std::filesystem::exists(configPath)) config::ConfigRegistry::init(configPath);
        else config::ConfigRegistry::init(config::Config{});
        log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize drivelock: " << e.what() << std::endl;
        return 1;
    }

    const auto& cfg = config::ConfigRegistry::get();
    host::ModelDocumentEvents model;
    host::CompanionDocumentServer companion;

    plugin::Plugin locker(
        cfg,
        [&cfg] { return std::make_shared<lock::LocalDriveClient>(cfg.drive); },
        std::make_shared<notify::ConsoleSink>(cfg.plugin.name),
        model, companion);

    std::string error;
    if (locker.onLoad(error) != plugin::LoadReturnCode::Success) return 1;

    printUsage();
    for (std::string line; std::cout << "> " << std::flush, std::getline(std::cin, line);) {
        std::istringstream in(line);
        std::string cmd;
        in >> cmd;

        if (cmd.empty()) continue;
        if (cmd == "quit" || cmd == "exit") break;

        const auto path = restOfLine(in);

        if (cmd == "open") model.endOpenDocument.raise({path, false, false});
        else if (cmd == "import") model.endOpenDocument.raise({path, true, false});
        else if (cmd == "close") {
            host::CloseDocumentArgs args;
            if (!path.empty()) args.path = path;
            model.closeDocument.raise(args);
        }
        else if (cmd == "gh-open" || cmd == "gh-close") {
            host::CompanionDocument doc;
            if (!path.empty()) doc.filePath = path;
            if (cmd == "gh-open") companion.documentAdded.raise(doc);
            else companion.documentRemoved.raise(doc);
        }
        else if (cmd == "reopen-log") log::Registry::reopenMainLog();
        else printUsage();
    }

    locker.shutdown();
    return 0;
}
