#include "clone/kvm/libvirt_client.hpp"
#include "clone/clone_errors.hpp"
#include "clone/descriptor_xml.hpp"
#include "common/logger.hpp"
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>
#include <cstdlib>

LibvirtClient::LibvirtClient()
    : conn_(nullptr) {
}

LibvirtClient::~LibvirtClient() {
    disconnect();
}

void LibvirtClient::connect(const std::string& uri, bool readOnly) {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();

    if (readOnly) {
        Logger::info("Open readonly connection to libvirt daemon at " + uri);
        conn_ = virConnectOpenReadOnly(uri.c_str());
    } else {
        Logger::info("Open connection to libvirt daemon at " + uri);
        conn_ = virConnectOpen(uri.c_str());
    }

    if (!conn_) {
        throw ProviderError("Failed to connect to " + uri + ": " + lastError());
    }
    uri_ = uri;
}

void LibvirtClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void LibvirtClient::closeLocked() {
    for (auto& entry : domains_) {
        virDomainFree(entry.second);
    }
    domains_.clear();

    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }
}

bool LibvirtClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_ != nullptr;
}

std::string LibvirtClient::describe(const std::string& domain) {
    virDomainPtr dom = lookupDomain(domain);

    char* xml = virDomainGetXMLDesc(dom, 0);
    if (!xml) {
        throw ProviderError("Failed to get XML description of domain " + domain + ": " + lastError());
    }
    std::string result(xml);
    free(xml);
    return result;
}

bool LibvirtClient::isActive(const std::string& domain) {
    virDomainPtr dom = lookupDomain(domain);

    int active = virDomainIsActive(dom);
    if (active < 0) {
        throw ProviderError("Failed to query state of domain " + domain + ": " + lastError());
    }
    return active == 1;
}

SnapshotHandle LibvirtClient::createSnapshot(const std::string& domain, const SnapshotDescriptor& descriptor,
                                             unsigned int flags) {
    virDomainPtr dom = lookupDomain(domain);
    std::string xml = DescriptorXml::formatSnapshot(descriptor);

    virDomainSnapshotPtr snapshot = virDomainSnapshotCreateXML(dom, xml.c_str(), toLibvirtSnapshotFlags(flags));
    if (!snapshot) {
        throw ProviderError("Failed to create snapshot of domain " + domain + ": " + lastError());
    }

    SnapshotHandle handle;
    const char* name = virDomainSnapshotGetName(snapshot);
    handle.name = name ? name : descriptor.name;
    virDomainSnapshotFree(snapshot);
    return handle;
}

void LibvirtClient::startBlockCommit(const std::string& domain, const std::string& device, const std::string& base,
                                     const std::string& top, unsigned long bandwidth, unsigned int flags) {
    virDomainPtr dom = lookupDomain(domain);

    int rc = virDomainBlockCommit(dom, device.c_str(),
                                  base.empty() ? nullptr : base.c_str(),
                                  top.empty() ? nullptr : top.c_str(),
                                  bandwidth, toLibvirtCommitFlags(flags));
    if (rc < 0) {
        throw ProviderError("Failed to start block commit of " + domain + "/" + device + ": " + lastError());
    }
}

BlockJobStatus LibvirtClient::blockJobStatus(const std::string& domain, const std::string& device) {
    virDomainPtr dom = lookupDomain(domain);

    virDomainBlockJobInfo info;
    int rc = virDomainGetBlockJobInfo(dom, device.c_str(), &info, 0);
    if (rc < 0) {
        throw ProviderError("Failed to get block job info of " + domain + "/" + device + ": " + lastError());
    }

    BlockJobStatus status;
    if (rc == 1) {
        status.present = true;
        status.current = info.cur;
        status.end = info.end;
    }
    return status;
}

void LibvirtClient::abortBlockJob(const std::string& domain, const std::string& device, bool pivot) {
    virDomainPtr dom = lookupDomain(domain);

    unsigned int flags = pivot ? VIR_DOMAIN_BLOCK_JOB_ABORT_PIVOT : 0;
    if (virDomainBlockJobAbort(dom, device.c_str(), flags) < 0) {
        throw ProviderError("Failed to abort block job of " + domain + "/" + device + ": " + lastError());
    }
}

virDomainPtr LibvirtClient::lookupDomain(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!conn_) {
        throw ProviderError("Not connected to libvirt daemon");
    }

    auto it = domains_.find(domain);
    if (it != domains_.end()) {
        return it->second;
    }

    Logger::debug("Lookup domain " + domain + " by name");
    virDomainPtr dom = virDomainLookupByName(conn_, domain.c_str());
    if (!dom) {
        throw ProviderError("Failed to find domain " + domain + ": " + lastError());
    }
    domains_.emplace(domain, dom);
    return dom;
}

unsigned int LibvirtClient::toLibvirtSnapshotFlags(unsigned int flags) {
    unsigned int result = 0;
    if (flags & SNAPSHOT_NO_METADATA) {
        result |= VIR_DOMAIN_SNAPSHOT_CREATE_NO_METADATA;
    }
    if (flags & SNAPSHOT_DISK_ONLY) {
        result |= VIR_DOMAIN_SNAPSHOT_CREATE_DISK_ONLY;
    }
    if (flags & SNAPSHOT_QUIESCE) {
        result |= VIR_DOMAIN_SNAPSHOT_CREATE_QUIESCE;
    }
    if (flags & SNAPSHOT_ATOMIC) {
        result |= VIR_DOMAIN_SNAPSHOT_CREATE_ATOMIC;
    }
    return result;
}

unsigned int LibvirtClient::toLibvirtCommitFlags(unsigned int flags) {
    unsigned int result = 0;
    if (flags & BLOCK_COMMIT_SHALLOW) {
        result |= VIR_DOMAIN_BLOCK_COMMIT_SHALLOW;
    }
    if (flags & BLOCK_COMMIT_ACTIVE) {
        result |= VIR_DOMAIN_BLOCK_COMMIT_ACTIVE;
    }
    return result;
}

std::string LibvirtClient::lastError() {
    const char* message = virGetLastErrorMessage();
    return message ? message : "unknown libvirt error";
}
