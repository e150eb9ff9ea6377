#include "clone/disk_copier.hpp"
#include "clone/clone_errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <sys/wait.h>

DiskCopier::DiskCopier(const std::string& qemuImgPath, const std::string& cpPath)
    : qemuImgPath_(qemuImgPath)
    , cpPath_(cpPath) {
}

std::string DiskCopier::artifactName(const SnapshotDisk& disk) {
    if (disk.sourceKind == "block") {
        return disk.device + ".img";
    }
    if (disk.sourceKind == "file") {
        return disk.device + std::filesystem::path(disk.source).extension().string();
    }
    throw CopyError("Unsupported source type " + disk.sourceKind + " of device " + disk.device);
}

std::string DiskCopier::copyDisk(const SnapshotDisk& disk, const std::string& destDir, bool overwrite) const {
    std::string dest = (std::filesystem::path(destDir) / artifactName(disk)).string();

    Logger::info("Copy " + disk.device + " from " + disk.source + " to " + dest);
    if (disk.sourceKind == "block") {
        if (!overwrite && std::filesystem::exists(dest)) {
            throw CopyError("Destination already exists: " + dest);
        }
        copyBlock(disk.source, dest);
    } else {
        copyFile(disk.source, dest, overwrite);
    }
    return dest;
}

void DiskCopier::copyBlock(const std::string& source, const std::string& dest) const {
    run({qemuImgPath_, "convert", "-f", "raw", "-O", "qcow2", "-S", "4k", source, dest});
}

void DiskCopier::copyFile(const std::string& source, const std::string& dest, bool overwrite) const {
    std::vector<std::string> args = {cpPath_, "--sparse=auto"};

    if (!overwrite) {
        if (std::filesystem::exists(dest)) {
            throw CopyError("Destination already exists: " + dest);
        }
        args.push_back("--no-clobber");
    }

    args.push_back(source);
    args.push_back(dest);
    run(args);
}

void DiskCopier::run(const std::vector<std::string>& args) const {
    std::string command = utils::joinCommand(args);
    Logger::debug("Executing " + command);

    int status = std::system(command.c_str());
    if (status == -1) {
        throw CopyError("Failed to execute " + args.front());
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw CopyError("Command " + describeStatus(status) + ": " + command);
    }
}

std::string DiskCopier::describeStatus(int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "ended abnormally with wait status " + std::to_string(status);
}
