#include "clone/descriptor_xml.hpp"
#include "clone/clone_errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>
#include <stdexcept>

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

bool isElement(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, BAD_CAST name) == 0;
}

xmlNodePtr findChild(xmlNodePtr parent, const char* name) {
    for (xmlNodePtr child = parent->children; child; child = child->next) {
        if (isElement(child, name)) {
            return child;
        }
    }
    return nullptr;
}

std::string getProp(xmlNodePtr node, const char* name) {
    if (!node) {
        return "";
    }
    xmlChar* value = xmlGetProp(node, BAD_CAST name);
    if (!value) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string getText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return result;
}

DiskDescriptor parseDisk(xmlNodePtr node) {
    DiskDescriptor disk;
    disk.deviceKind = getProp(node, "device");
    disk.sourceKind = getProp(node, "type");
    disk.snapshotMode = getProp(node, "snapshot");
    disk.deviceName = getProp(findChild(node, "target"), "dev");
    disk.driverName = getProp(findChild(node, "driver"), "name");
    disk.driverFormat = getProp(findChild(node, "driver"), "type");

    xmlNodePtr source = findChild(node, "source");
    if (disk.sourceKind == "file") {
        disk.sourcePath = getProp(source, "file");
    } else if (disk.sourceKind == "block") {
        disk.sourcePath = getProp(source, "dev");
    }

    disk.readOnly = findChild(node, "readonly") != nullptr;
    disk.shareable = findChild(node, "shareable") != nullptr;
    disk.transient = findChild(node, "transient") != nullptr;
    return disk;
}

}  // namespace

DomainDescriptor DescriptorXml::parseDomain(const std::string& xml) {
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "domain.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                  &xmlFreeDoc);
    if (!doc) {
        throw DescriptorError("Failed to parse domain XML");
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root || !isElement(root, "domain")) {
        throw DescriptorError("Domain XML has no <domain> root element");
    }

    DomainDescriptor domain;
    domain.rawXml = xml;

    xmlNodePtr nameNode = findChild(root, "name");
    if (nameNode) {
        domain.name = getText(nameNode);
    }
    if (domain.name.empty()) {
        throw DescriptorError("Domain XML has no <name>");
    }

    xmlNodePtr devices = findChild(root, "devices");
    if (devices) {
        for (xmlNodePtr child = devices->children; child; child = child->next) {
            if (isElement(child, "disk")) {
                domain.disks.push_back(parseDisk(child));
            }
        }
    }

    return domain;
}

std::string DescriptorXml::formatSnapshot(const SnapshotDescriptor& descriptor, bool pretty) {
    XmlDocPtr doc(xmlNewDoc(BAD_CAST "1.0"), &xmlFreeDoc);
    if (!doc) {
        throw std::runtime_error("Failed to allocate snapshot XML document");
    }

    xmlNodePtr root = xmlNewNode(nullptr, BAD_CAST "domainsnapshot");
    xmlDocSetRootElement(doc.get(), root);

    xmlNewTextChild(root, nullptr, BAD_CAST "name", BAD_CAST descriptor.name.c_str());
    xmlNewTextChild(root, nullptr, BAD_CAST "description", BAD_CAST descriptor.description.c_str());

    xmlNodePtr memory = xmlNewChild(root, nullptr, BAD_CAST "memory", nullptr);
    if (descriptor.memoryMode == MemoryMode::EXTERNAL_FILE) {
        xmlNewProp(memory, BAD_CAST "snapshot", BAD_CAST "external");
        xmlNewProp(memory, BAD_CAST "file", BAD_CAST descriptor.memoryFile.c_str());
    } else {
        xmlNewProp(memory, BAD_CAST "snapshot", BAD_CAST "no");
    }

    xmlNodePtr disks = xmlNewChild(root, nullptr, BAD_CAST "disks", nullptr);
    for (const auto& delta : descriptor.deltas) {
        xmlNodePtr disk = xmlNewChild(disks, nullptr, BAD_CAST "disk", nullptr);
        xmlNewProp(disk, BAD_CAST "name", BAD_CAST delta.deviceName.c_str());
        xmlNewProp(disk, BAD_CAST "snapshot", BAD_CAST "external");

        xmlNodePtr source = xmlNewChild(disk, nullptr, BAD_CAST "source", nullptr);
        xmlNewProp(source, BAD_CAST "file", BAD_CAST delta.deltaPath.c_str());

        xmlNodePtr driver = xmlNewChild(disk, nullptr, BAD_CAST "driver", nullptr);
        xmlNewProp(driver, BAD_CAST "type", BAD_CAST delta.deltaFormat.c_str());
    }

    std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buffer(xmlBufferCreate(), &xmlBufferFree);
    if (!buffer || xmlNodeDump(buffer.get(), doc.get(), root, 0, pretty ? 1 : 0) < 0) {
        throw std::runtime_error("Failed to serialize snapshot XML");
    }

    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())));
}
