#pragma once

#include "clone/clone_types.hpp"
#include <string>

// libvirt XML dialect for domain and snapshot descriptors
class DescriptorXml {
public:
    // Throws DescriptorError on malformed XML or a domain without a name
    static DomainDescriptor parseDomain(const std::string& xml);

    // <domainsnapshot> document accepted by virDomainSnapshotCreateXML
    static std::string formatSnapshot(const SnapshotDescriptor& descriptor, bool pretty = false);
};
