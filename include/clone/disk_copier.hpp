#pragma once

#include "clone/clone_types.hpp"
#include <string>
#include <vector>

// Copies snapshot base images with the qemu-img and cp utilities
class DiskCopier {
public:
    DiskCopier(const std::string& qemuImgPath = "/usr/bin/qemu-img", const std::string& cpPath = "/bin/cp");

    // "<device>.img" for block sources, "<device><extension>" for files
    static std::string artifactName(const SnapshotDisk& disk);

    // Returns the path of the produced artifact. Throws CopyError.
    std::string copyDisk(const SnapshotDisk& disk, const std::string& destDir, bool overwrite = false) const;

    // Readable form of a wait status returned by std::system
    static std::string describeStatus(int status);

    void copyBlock(const std::string& source, const std::string& dest) const;
    void copyFile(const std::string& source, const std::string& dest, bool overwrite = false) const;

private:
    void run(const std::vector<std::string>& args) const;

    std::string qemuImgPath_;
    std::string cpPath_;
};
