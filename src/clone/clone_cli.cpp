#include "clone/clone_cli.hpp"
#include "clone/clone_errors.hpp"
#include "clone/clone_manifest.hpp"
#include "clone/descriptor_xml.hpp"
#include "clone/transaction_scope.hpp"
#include "clone/vm_transaction.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>

namespace {

bool parseSeconds(const std::string& value, int minimum, int& seconds) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size() || parsed < minimum) {
            return false;
        }
        seconds = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

CloneCLI::CloneCLI(std::shared_ptr<HypervisorClient> client, DiskCopier copier)
    : client_(std::move(client))
    , copier_(std::move(copier)) {
}

void CloneCLI::printUsage() {
    std::cout << "Usage: vmclone [options] <domain> <destdir>\n"
              << "\n"
              << "Options:\n"
              << "  -c, --connect URI      URI to a hypervisor (default qemu:///system)\n"
              << "      --disk-only        Save the disk state only, no memory state is preserved\n"
              << "      --quiesce          Quiesce guest filesystems before the snapshot\n"
              << "      --workdir DIR      Working directory for delta and memory files\n"
              << "  -v, --verbose          Increase verbosity (repeatable)\n"
              << "  -n, --dry-run          Open a readonly connection and only print the plan\n"
              << "      --checksum         Record the SHA-256 of every artifact\n"
              << "      --overwrite        Overwrite existing artifacts in destdir\n"
              << "      --poll-interval S  Block job poll interval in seconds (default 10, minimum 1)\n"
              << "      --timeout S        Per disk block commit deadline in seconds (0 = none)\n"
              << "      --log-file PATH    Also append log lines to PATH\n"
              << "  -h, --help             Show this help message\n"
              << "      --version          Show version information\n";
}

CloneCLI::ParseResult CloneCLI::parseOptions(int argc, char* argv[], CloneOptions& options, std::string& error) {
    std::vector<std::string> positionals;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto needValue = [&](std::string& value) {
            if (i + 1 >= argc) {
                error = "Option " + arg + " requires a value";
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            return ParseResult::HELP;
        } else if (arg == "--version") {
            return ParseResult::VERSION;
        } else if (arg == "-c" || arg == "--connect") {
            if (!needValue(options.connectUri)) return ParseResult::ERROR;
        } else if (arg == "--workdir") {
            if (!needValue(options.workdir)) return ParseResult::ERROR;
        } else if (arg == "--log-file") {
            if (!needValue(options.logFile)) return ParseResult::ERROR;
        } else if (arg == "--disk-only") {
            options.diskOnly = true;
        } else if (arg == "--quiesce") {
            options.quiesce = true;
        } else if (arg == "-n" || arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--checksum") {
            options.checksum = true;
        } else if (arg == "--overwrite") {
            options.overwrite = true;
        } else if (arg == "--verbose") {
            options.verbosity++;
        } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
                   arg.find_first_not_of('v', 1) == std::string::npos) {
            options.verbosity += static_cast<int>(arg.size() - 1);
        } else if (arg == "--poll-interval" || arg == "--timeout") {
            std::string value;
            if (!needValue(value)) return ParseResult::ERROR;
            bool timeout = arg == "--timeout";
            int& target = timeout ? options.timeoutSeconds : options.pollIntervalSeconds;
            // A zero timeout disables the deadline; polling needs a real pause
            if (!parseSeconds(value, timeout ? 0 : 1, target)) {
                error = "Invalid number of seconds for " + arg + ": " + value;
                return ParseResult::ERROR;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return ParseResult::ERROR;
        } else {
            positionals.push_back(arg);
        }
    }

    if (positionals.size() != 2) {
        error = "Expected <domain> and <destdir>";
        return ParseResult::ERROR;
    }

    options.domain = positionals[0];
    options.destDir = positionals[1];
    return ParseResult::OK;
}

TransactionConfig CloneCLI::toTransactionConfig(const CloneOptions& options) {
    TransactionConfig config;
    config.workdir = options.workdir;
    config.diskOnly = options.diskOnly;
    config.quiesce = options.quiesce;
    config.pollInterval = std::chrono::seconds(options.pollIntervalSeconds);
    config.commitTimeout = std::chrono::seconds(options.timeoutSeconds);
    return config;
}

int CloneCLI::run(const CloneOptions& options) {
    if (options.workdir.empty()) {
        Logger::info("No workdir is specified");
    }
    Logger::info("Domain: " + options.domain);
    Logger::info("Working Directory: " + options.workdir);
    Logger::info("Backup Path: " + options.destDir);

    try {
        VMTransaction transaction(client_, options.domain, toTransactionConfig(options));
        if (options.dryRun) {
            return runDryRun(transaction, options);
        }
        return runClone(transaction, options);
    } catch (const CleanupAggregateError& e) {
        Logger::error(std::string("Disks committed but cleanup is incomplete: ") + e.what());
        for (const auto& path : e.failedPaths()) {
            Logger::error("Leftover delta file: " + path);
        }
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Clone failed: ") + e.what());
        return 1;
    }
}

int CloneCLI::runDryRun(VMTransaction& transaction, const CloneOptions& options) {
    transaction.initialize();
    transaction.prepare();

    std::cout << DescriptorXml::formatSnapshot(transaction.snapshotDescriptor(), true) << "\n";
    std::cout << "Snapshot flags: " << snapshotFlagNames(transaction.snapshotFlags()) << "\n";
    for (const auto& disk : transaction.snapshotDisks()) {
        std::string dest = (std::filesystem::path(options.destDir) / DiskCopier::artifactName(disk)).string();
        std::cout << disk.device << " (" << disk.sourceKind << "): " << disk.source << " -> " << dest << "\n";
    }
    return 0;
}

int CloneCLI::runClone(VMTransaction& transaction, const CloneOptions& options) {
    std::filesystem::create_directories(options.destDir);

    std::unique_ptr<CloneManifest> manifest;
    auto copyDisks = [&](VMTransaction& tx) {
        manifest = std::make_unique<CloneManifest>(tx.domainName(), tx.diskOnly(), tx.quiesce());
        for (const auto& disk : tx.snapshotDisks()) {
            ManifestEntry entry;
            entry.disk = disk;
            entry.artifact = copier_.copyDisk(disk, options.destDir, options.overwrite);
            if (options.checksum) {
                entry.sha256 = CloneManifest::calculateChecksum(entry.artifact);
                if (entry.sha256.empty()) {
                    throw CopyError("Failed to calculate checksum of " + entry.artifact);
                }
            }
            manifest->addEntry(entry);
        }
    };

    try {
        runInTransaction(transaction, copyDisks);
    } catch (const CleanupAggregateError&) {
        if (manifest) {
            manifest->write(options.destDir);
        }
        throw;
    }

    if (!manifest || !manifest->write(options.destDir)) {
        return 1;
    }

    std::cout << "Cloned " << manifest->entries().size() << " disks of " << transaction.domainName()
              << " into " << options.destDir << std::endl;
    return 0;
}
