#pragma once

#include <cstdint>
#include <string>
#include <vector>

// A <disk> element of the domain configuration
struct DiskDescriptor {
    std::string deviceName;   // target/@dev, unique within the domain
    std::string deviceKind;   // @device: "disk", "cdrom", "floppy", "lun"
    std::string sourceKind;   // @type: "file", "block", ...
    std::string sourcePath;   // source/@file or source/@dev
    std::string driverName;   // driver/@name
    std::string driverFormat; // driver/@type: "raw", "qcow2", ...
    std::string snapshotMode; // @snapshot: "no", "internal", "external" or empty
    bool readOnly{false};
    bool shareable{false};
    bool transient{false};
};

struct DomainDescriptor {
    std::string name;
    std::string rawXml;
    std::vector<DiskDescriptor> disks;  // document order
};

enum class MemoryMode {
    NONE,
    EXTERNAL_FILE
};

struct DiskDelta {
    std::string deviceName;
    std::string deltaPath;
    std::string deltaFormat;
};

struct SnapshotDescriptor {
    std::string name;
    std::string description;
    MemoryMode memoryMode{MemoryMode::NONE};
    std::string memoryFile;  // only set for EXTERNAL_FILE
    std::vector<DiskDelta> deltas;
};

// Snapshot creation flags, combinable as a bit set
enum SnapshotFlag : unsigned int {
    SNAPSHOT_NO_METADATA = 1u << 0,
    SNAPSHOT_DISK_ONLY   = 1u << 1,
    SNAPSHOT_QUIESCE     = 1u << 2,
    SNAPSHOT_ATOMIC      = 1u << 3
};

enum BlockCommitFlag : unsigned int {
    BLOCK_COMMIT_SHALLOW = 1u << 0,
    BLOCK_COMMIT_ACTIVE  = 1u << 1
};

struct SnapshotHandle {
    std::string name;
};

struct BlockJobStatus {
    bool present{false};
    uint64_t current{0};
    uint64_t end{0};

    bool hasJob() const { return present && end != 0; }
    bool readyToPivot() const { return hasJob() && current == end; }
};

// Base image of a snapshotted disk, handed to the copy layer
struct SnapshotDisk {
    std::string device;
    std::string source;
    std::string sourceKind;
};
