#pragma once

#include "clone/clone_types.hpp"
#include <string>

// Hypervisor operations a clone transaction depends on. Every method throws
// ProviderError when the hypervisor reports a failure.
class HypervisorClient {
public:
    virtual ~HypervisorClient() = default;

    // Domain operations
    virtual std::string describe(const std::string& domain) = 0;
    virtual bool isActive(const std::string& domain) = 0;
    virtual SnapshotHandle createSnapshot(const std::string& domain, const SnapshotDescriptor& descriptor,
                                          unsigned int flags) = 0;

    // Block jobs. An empty base commits into the immediate backing image.
    virtual void startBlockCommit(const std::string& domain, const std::string& device, const std::string& base,
                                  const std::string& top, unsigned long bandwidth, unsigned int flags) = 0;
    virtual BlockJobStatus blockJobStatus(const std::string& domain, const std::string& device) = 0;
    virtual void abortBlockJob(const std::string& domain, const std::string& device, bool pivot) = 0;
};
