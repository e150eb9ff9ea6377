#pragma once

#include "clone/clone_config.hpp"
#include "clone/clone_types.hpp"
#include <string>
#include <vector>

struct SnapshotSpec {
    SnapshotDescriptor descriptor;
    unsigned int flags{0};
};

// Computes the snapshot descriptor and creation flags for a set of selected
// disks. Makes no hypervisor calls.
class SnapshotSpecBuilder {
public:
    static constexpr const char* kSnapshotName = "vmclone";
    static constexpr const char* kDeltaFormat = "qcow2";
    static constexpr const char* kMemoryFileName = "memory.state";

    explicit SnapshotSpecBuilder(const TransactionConfig& config);

    // Throws ConfigurationError when memory capture or a delta location
    // cannot be satisfied
    SnapshotSpec build(const std::string& domainName, const std::vector<DiskDescriptor>& disks) const;

    std::string deltaPath(const std::string& domainName, const DiskDescriptor& disk) const;
    unsigned int flags() const;

private:
    TransactionConfig config_;
};

// "ATOMIC|NO_METADATA|DISK_ONLY"
std::string snapshotFlagNames(unsigned int flags);
std::string blockCommitFlagNames(unsigned int flags);
