#pragma once

#include "clone/clone_types.hpp"
#include <string>
#include <vector>

namespace fixtures {

inline DiskDescriptor fileDisk(const std::string& device, const std::string& path) {
    DiskDescriptor disk;
    disk.deviceName = device;
    disk.deviceKind = "disk";
    disk.sourceKind = "file";
    disk.sourcePath = path;
    disk.driverName = "qemu";
    disk.driverFormat = "qcow2";
    return disk;
}

inline DiskDescriptor blockDisk(const std::string& device, const std::string& path) {
    DiskDescriptor disk = fileDisk(device, path);
    disk.sourceKind = "block";
    disk.driverFormat = "raw";
    return disk;
}

inline std::string fileDiskXml(const std::string& device, const std::string& path) {
    return "    <disk type='file' device='disk'>\n"
           "      <driver name='qemu' type='qcow2'/>\n"
           "      <source file='" + path + "'/>\n"
           "      <target dev='" + device + "' bus='virtio'/>\n"
           "    </disk>\n";
}

inline std::string domainXml(const std::string& name, const std::vector<std::string>& disks) {
    std::string xml = "<domain type='kvm'>\n"
                      "  <name>" + name + "</name>\n"
                      "  <memory unit='KiB'>1048576</memory>\n"
                      "  <devices>\n";
    for (const auto& disk : disks) {
        xml += disk;
    }
    xml += "  </devices>\n"
           "</domain>\n";
    return xml;
}

// Two eligible disks, a cdrom and a read-only disk
inline std::string sampleDomainXml() {
    return domainXml("vm1", {
        fileDiskXml("vda", "/data/vm1.qcow2"),
        "    <disk type='block' device='disk'>\n"
        "      <driver name='qemu' type='raw' cache='none'/>\n"
        "      <source dev='/dev/vg0/vm1-data'/>\n"
        "      <target dev='vdb' bus='virtio'/>\n"
        "    </disk>\n",
        "    <disk type='file' device='cdrom'>\n"
        "      <driver name='qemu' type='raw'/>\n"
        "      <source file='/iso/install.iso'/>\n"
        "      <target dev='hdc' bus='ide'/>\n"
        "      <readonly/>\n"
        "    </disk>\n",
        "    <disk type='file' device='disk' snapshot='no'>\n"
        "      <driver name='qemu' type='qcow2'/>\n"
        "      <source file='/data/scratch.qcow2'/>\n"
        "      <target dev='vdc' bus='virtio'/>\n"
        "    </disk>\n",
    });
}

} // namespace fixtures
