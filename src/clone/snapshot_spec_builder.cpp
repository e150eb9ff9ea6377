#include "clone/snapshot_spec_builder.hpp"
#include "clone/clone_errors.hpp"
#include <filesystem>
#include <utility>

namespace {

std::string joinFlagNames(const std::vector<std::pair<unsigned int, const char*>>& names, unsigned int flags) {
    std::string result;
    for (const auto& entry : names) {
        if ((flags & entry.first) == entry.first) {
            if (!result.empty()) {
                result += "|";
            }
            result += entry.second;
        }
    }
    return result.empty() ? "0" : result;
}

}  // namespace

SnapshotSpecBuilder::SnapshotSpecBuilder(const TransactionConfig& config)
    : config_(config) {
}

SnapshotSpec SnapshotSpecBuilder::build(const std::string& domainName,
                                        const std::vector<DiskDescriptor>& disks) const {
    SnapshotSpec spec;
    spec.descriptor.name = kSnapshotName;
    spec.descriptor.description = kSnapshotName;

    if (config_.diskOnly) {
        spec.descriptor.memoryMode = MemoryMode::NONE;
    } else {
        if (config_.workdir.empty()) {
            throw ConfigurationError("workdir is required to save the memory state");
        }
        spec.descriptor.memoryMode = MemoryMode::EXTERNAL_FILE;
        spec.descriptor.memoryFile = (std::filesystem::path(config_.workdir) / kMemoryFileName).string();
    }

    for (const auto& disk : disks) {
        DiskDelta delta;
        delta.deviceName = disk.deviceName;
        delta.deltaPath = deltaPath(domainName, disk);
        delta.deltaFormat = kDeltaFormat;
        spec.descriptor.deltas.push_back(std::move(delta));
    }

    spec.flags = flags();
    return spec;
}

std::string SnapshotSpecBuilder::deltaPath(const std::string& domainName, const DiskDescriptor& disk) const {
    if (!config_.workdir.empty()) {
        std::string basename = domainName + "-" + disk.deviceName + "-unmerged.qcow2";
        return (std::filesystem::path(config_.workdir) / basename).string();
    }

    if (disk.sourceKind != "file") {
        throw ConfigurationError("No workdir is available to back up disk <" + disk.deviceName + ", " +
                                 disk.deviceKind + ">");
    }

    std::filesystem::path source(disk.sourcePath);
    std::string basename = source.stem().string() + "-unmerged.qcow2";
    return (source.parent_path() / basename).string();
}

unsigned int SnapshotSpecBuilder::flags() const {
    unsigned int flags = SNAPSHOT_NO_METADATA | SNAPSHOT_ATOMIC;
    if (config_.diskOnly) {
        flags |= SNAPSHOT_DISK_ONLY;
    }
    if (config_.quiesce) {
        flags |= SNAPSHOT_QUIESCE;
    }
    return flags;
}

std::string snapshotFlagNames(unsigned int flags) {
    return joinFlagNames({
        {SNAPSHOT_ATOMIC, "ATOMIC"},
        {SNAPSHOT_NO_METADATA, "NO_METADATA"},
        {SNAPSHOT_DISK_ONLY, "DISK_ONLY"},
        {SNAPSHOT_QUIESCE, "QUIESCE"},
    }, flags);
}

std::string blockCommitFlagNames(unsigned int flags) {
    return joinFlagNames({
        {BLOCK_COMMIT_SHALLOW, "SHALLOW"},
        {BLOCK_COMMIT_ACTIVE, "ACTIVE"},
    }, flags);
}
