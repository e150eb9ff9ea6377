#pragma once

#include "clone/clone_types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

struct ManifestEntry {
    SnapshotDisk disk;
    std::string artifact;
    std::string sha256;  // empty when checksums are disabled
};

// Describes the artifacts of one clone run, written as manifest.json
class CloneManifest {
public:
    CloneManifest(const std::string& domainName, bool diskOnly, bool quiesce);

    void addEntry(const ManifestEntry& entry);
    const std::vector<ManifestEntry>& entries() const { return entries_; }

    nlohmann::json toJson() const;
    bool write(const std::string& destDir) const;

    // Hex SHA-256 of a file, empty on failure
    static std::string calculateChecksum(const std::string& filePath);

private:
    std::string domainName_;
    bool diskOnly_;
    bool quiesce_;
    int64_t timestamp_;
    std::vector<ManifestEntry> entries_;
};
