#pragma once

#include "clone/clone_config.hpp"
#include "clone/disk_copier.hpp"
#include "clone/hypervisor_client.hpp"
#include <memory>
#include <string>

class VMTransaction;

class CloneCLI {
public:
    enum class ParseResult {
        OK,
        HELP,
        VERSION,
        ERROR
    };

    explicit CloneCLI(std::shared_ptr<HypervisorClient> client, DiskCopier copier = DiskCopier());

    static ParseResult parseOptions(int argc, char* argv[], CloneOptions& options, std::string& error);
    static TransactionConfig toTransactionConfig(const CloneOptions& options);
    static void printUsage();

    // Returns the process exit status
    int run(const CloneOptions& options);

private:
    int runDryRun(VMTransaction& transaction, const CloneOptions& options);
    int runClone(VMTransaction& transaction, const CloneOptions& options);

    std::shared_ptr<HypervisorClient> client_;
    DiskCopier copier_;
};
