#include "clone/disk_selector.hpp"
#include "common/logger.hpp"
#include <stdexcept>
#include <utility>

bool DefaultDiskSelector::select(const DiskDescriptor& disk) const {
    // Skip snapshot, readonly, shareable and transient disks
    if (disk.snapshotMode == "no" || disk.readOnly || disk.shareable || disk.transient) {
        Logger::debug("reject dev " + disk.deviceName + " due to property");
        return false;
    }

    if (disk.driverName != "qemu") {
        Logger::debug("reject dev " + disk.deviceName + " due to driver type");
        return false;
    }

    if (disk.driverFormat != "raw" && disk.driverFormat != "qcow2") {
        Logger::debug("reject dev " + disk.deviceName + " due to driver subtype");
        return false;
    }

    // Only disk devices backed by file and block are currently supported
    if (disk.deviceKind == "disk" && (disk.sourceKind == "file" || disk.sourceKind == "block")) {
        Logger::debug("accept dev " + disk.deviceName);
        return true;
    }

    Logger::debug("reject dev " + disk.deviceName);
    return false;
}

FunctionDiskSelector::FunctionDiskSelector(Predicate predicate)
    : predicate_(std::move(predicate)) {
    if (!predicate_) {
        throw std::invalid_argument("Disk selector predicate is empty");
    }
}

bool FunctionDiskSelector::select(const DiskDescriptor& disk) const {
    return predicate_(disk);
}

std::shared_ptr<DiskSelector> makeDiskSelector(FunctionDiskSelector::Predicate predicate) {
    return std::make_shared<FunctionDiskSelector>(std::move(predicate));
}
