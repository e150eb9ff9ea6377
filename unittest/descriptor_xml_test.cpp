#include <gtest/gtest.h>
#include "clone/clone_errors.hpp"
#include "clone/descriptor_xml.hpp"
#include "test_fixtures.hpp"

TEST(DescriptorXmlTest, ParsesDisksInDocumentOrder) {
    DomainDescriptor domain = DescriptorXml::parseDomain(fixtures::sampleDomainXml());

    EXPECT_EQ("vm1", domain.name);
    EXPECT_EQ(fixtures::sampleDomainXml(), domain.rawXml);
    ASSERT_EQ(4u, domain.disks.size());

    const DiskDescriptor& vda = domain.disks[0];
    EXPECT_EQ("vda", vda.deviceName);
    EXPECT_EQ("disk", vda.deviceKind);
    EXPECT_EQ("file", vda.sourceKind);
    EXPECT_EQ("/data/vm1.qcow2", vda.sourcePath);
    EXPECT_EQ("qemu", vda.driverName);
    EXPECT_EQ("qcow2", vda.driverFormat);
    EXPECT_FALSE(vda.readOnly);

    const DiskDescriptor& vdb = domain.disks[1];
    EXPECT_EQ("vdb", vdb.deviceName);
    EXPECT_EQ("block", vdb.sourceKind);
    EXPECT_EQ("/dev/vg0/vm1-data", vdb.sourcePath);
    EXPECT_EQ("raw", vdb.driverFormat);

    EXPECT_EQ("hdc", domain.disks[2].deviceName);
    EXPECT_EQ("cdrom", domain.disks[2].deviceKind);
    EXPECT_TRUE(domain.disks[2].readOnly);

    EXPECT_EQ("vdc", domain.disks[3].deviceName);
    EXPECT_EQ("no", domain.disks[3].snapshotMode);
}

TEST(DescriptorXmlTest, ParsesShareableAndTransientFlags) {
    std::string xml = fixtures::domainXml("vm2", {
        "<disk type='file' device='disk'><driver name='qemu' type='raw'/>"
        "<source file='/a.img'/><target dev='vda'/><shareable/></disk>",
        "<disk type='file' device='disk'><driver name='qemu' type='raw'/>"
        "<source file='/b.img'/><target dev='vdb'/><transient/></disk>",
    });

    DomainDescriptor domain = DescriptorXml::parseDomain(xml);

    ASSERT_EQ(2u, domain.disks.size());
    EXPECT_TRUE(domain.disks[0].shareable);
    EXPECT_FALSE(domain.disks[0].transient);
    EXPECT_TRUE(domain.disks[1].transient);
}

TEST(DescriptorXmlTest, DomainWithoutDevicesHasNoDisks) {
    DomainDescriptor domain = DescriptorXml::parseDomain("<domain><name>empty</name></domain>");

    EXPECT_EQ("empty", domain.name);
    EXPECT_TRUE(domain.disks.empty());
}

TEST(DescriptorXmlTest, MalformedXmlIsDescriptorError) {
    EXPECT_THROW(DescriptorXml::parseDomain("<domain><name>vm1</name>"), DescriptorError);
    EXPECT_THROW(DescriptorXml::parseDomain(""), DescriptorError);
    EXPECT_THROW(DescriptorXml::parseDomain("<network><name>default</name></network>"), DescriptorError);
    EXPECT_THROW(DescriptorXml::parseDomain("<domain><devices/></domain>"), DescriptorError);
}

TEST(DescriptorXmlTest, FormatsDiskOnlySnapshot) {
    SnapshotDescriptor descriptor;
    descriptor.name = "vmclone";
    descriptor.description = "vmclone";
    descriptor.deltas.push_back(DiskDelta{"vda", "/w/vm1-vda-unmerged.qcow2", "qcow2"});

    std::string xml = DescriptorXml::formatSnapshot(descriptor);

    EXPECT_EQ("<domainsnapshot><name>vmclone</name><description>vmclone</description>"
              "<memory snapshot=\"no\"/><disks><disk name=\"vda\" snapshot=\"external\">"
              "<source file=\"/w/vm1-vda-unmerged.qcow2\"/><driver type=\"qcow2\"/></disk></disks>"
              "</domainsnapshot>",
              xml);
}

TEST(DescriptorXmlTest, FormatsExternalMemoryAndEscapesPaths) {
    SnapshotDescriptor descriptor;
    descriptor.name = "vmclone";
    descriptor.description = "vmclone";
    descriptor.memoryMode = MemoryMode::EXTERNAL_FILE;
    descriptor.memoryFile = "/w/memory.state";
    descriptor.deltas.push_back(DiskDelta{"vda", "/w/a&b-unmerged.qcow2", "qcow2"});

    std::string xml = DescriptorXml::formatSnapshot(descriptor);

    EXPECT_NE(std::string::npos, xml.find("<memory snapshot=\"external\" file=\"/w/memory.state\"/>"));
    EXPECT_NE(std::string::npos, xml.find("file=\"/w/a&amp;b-unmerged.qcow2\""));
}
