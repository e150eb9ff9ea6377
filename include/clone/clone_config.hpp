#pragma once

#include <chrono>
#include <string>

// Settings consumed by a VMTransaction
struct TransactionConfig {
    std::string workdir;     // empty: deltas are placed beside their base images
    bool diskOnly{true};     // no memory state is saved
    bool quiesce{false};
    std::chrono::milliseconds pollInterval{std::chrono::seconds(10)};
    std::chrono::milliseconds commitTimeout{0};  // per disk, zero polls forever
};

// Settings of the vmclone command line
struct CloneOptions {
    std::string connectUri{"qemu:///system"};
    std::string domain;
    std::string destDir;
    std::string workdir;
    std::string logFile;
    bool diskOnly{false};
    bool quiesce{false};
    bool dryRun{false};
    bool checksum{false};
    bool overwrite{false};
    int verbosity{0};
    int pollIntervalSeconds{10};
    int timeoutSeconds{0};
};
