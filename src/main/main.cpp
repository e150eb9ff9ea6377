#include "clone/clone_cli.hpp"
#include "clone/kvm/libvirt_client.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <memory>
#include <string>

#ifndef VMCLONE_VERSION
#define VMCLONE_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    CloneOptions options;
    std::string error;

    switch (CloneCLI::parseOptions(argc, argv, options, error)) {
        case CloneCLI::ParseResult::HELP:
            CloneCLI::printUsage();
            return 0;
        case CloneCLI::ParseResult::VERSION:
            std::cout << "vmclone version " << VMCLONE_VERSION << "\n";
            return 0;
        case CloneCLI::ParseResult::ERROR:
            std::cerr << "Error: " << error << std::endl;
            CloneCLI::printUsage();
            return 2;
        case CloneCLI::ParseResult::OK:
            break;
    }

    if (!Logger::initialize(options.logFile, Logger::levelFromVerbosity(options.verbosity))) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    try {
        auto client = std::make_shared<LibvirtClient>();
        client->connect(options.connectUri, options.dryRun);

        CloneCLI cli(client);
        int status = cli.run(options);
        Logger::shutdown();
        return status;
    } catch (const std::exception& e) {
        Logger::error("Error in main: " + std::string(e.what()));
        Logger::shutdown();
        return 1;
    }
}
