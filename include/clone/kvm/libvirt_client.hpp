#pragma once

#include "clone/hypervisor_client.hpp"
#include <libvirt/libvirt.h>
#include <mutex>
#include <string>
#include <unordered_map>

class LibvirtClient : public HypervisorClient {
public:
    LibvirtClient();
    ~LibvirtClient() override;

    LibvirtClient(const LibvirtClient&) = delete;
    LibvirtClient& operator=(const LibvirtClient&) = delete;

    // Connection management
    void connect(const std::string& uri, bool readOnly = false);
    void disconnect();
    bool isConnected() const;

    std::string describe(const std::string& domain) override;
    bool isActive(const std::string& domain) override;
    SnapshotHandle createSnapshot(const std::string& domain, const SnapshotDescriptor& descriptor,
                                  unsigned int flags) override;

    void startBlockCommit(const std::string& domain, const std::string& device, const std::string& base,
                          const std::string& top, unsigned long bandwidth, unsigned int flags) override;
    BlockJobStatus blockJobStatus(const std::string& domain, const std::string& device) override;
    void abortBlockJob(const std::string& domain, const std::string& device, bool pivot) override;

private:
    virDomainPtr lookupDomain(const std::string& domain);
    // Caller holds mutex_
    void closeLocked();
    static unsigned int toLibvirtSnapshotFlags(unsigned int flags);
    static unsigned int toLibvirtCommitFlags(unsigned int flags);
    static std::string lastError();

    virConnectPtr conn_ = nullptr;
    std::string uri_;
    std::unordered_map<std::string, virDomainPtr> domains_;
    mutable std::mutex mutex_;
};
