#pragma once

#include "clone/clone_types.hpp"
#include <functional>
#include <memory>

// Decides whether a disk takes part in the snapshot
class DiskSelector {
public:
    virtual ~DiskSelector() = default;

    virtual bool select(const DiskDescriptor& disk) const = 0;
};

// Accepts writable, non-shared qemu disks in raw or qcow2 format backed by
// a file or a block device
class DefaultDiskSelector : public DiskSelector {
public:
    bool select(const DiskDescriptor& disk) const override;
};

class FunctionDiskSelector : public DiskSelector {
public:
    using Predicate = std::function<bool(const DiskDescriptor&)>;

    explicit FunctionDiskSelector(Predicate predicate);

    bool select(const DiskDescriptor& disk) const override;

private:
    Predicate predicate_;
};

std::shared_ptr<DiskSelector> makeDiskSelector(FunctionDiskSelector::Predicate predicate);
