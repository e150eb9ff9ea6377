#pragma once

#include "clone/clone_errors.hpp"
#include "clone/hypervisor_client.hpp"
#include <deque>
#include <map>
#include <string>
#include <vector>

// Thrown by the double to model a client that reports errors outside the
// std::exception hierarchy
struct HostFault {
    std::string call;
};

// Hypervisor double with scripted block job sequences. Once a device's
// script runs out, its job is reported as gone.
class FakeHypervisorClient : public HypervisorClient {
public:
    struct CommitCall {
        std::string device;
        std::string base;
        std::string top;
        unsigned long bandwidth;
        unsigned int flags;
    };

    struct AbortCall {
        std::string device;
        bool pivot;
    };

    std::string domainXml;
    bool active{true};
    bool failCreateSnapshot{false};
    std::string failCommitDevice;
    bool hostFaultOnSnapshot{false};
    std::string hostFaultCommitDevice;
    std::map<std::string, std::deque<BlockJobStatus>> jobScripts;
    // Reported forever for devices in this set
    std::map<std::string, BlockJobStatus> stuckJobs;

    int describeCalls{0};
    int isActiveCalls{0};
    int createSnapshotCalls{0};
    SnapshotDescriptor lastDescriptor;
    unsigned int lastSnapshotFlags{0};
    std::vector<CommitCall> commitCalls;
    std::vector<AbortCall> abortCalls;
    std::map<std::string, int> statusCalls;

    static BlockJobStatus job(uint64_t current, uint64_t end) {
        BlockJobStatus status;
        status.present = true;
        status.current = current;
        status.end = end;
        return status;
    }

    static BlockJobStatus noJob() {
        return BlockJobStatus();
    }

    std::string describe(const std::string& domain) override {
        describeCalls++;
        return domainXml;
    }

    bool isActive(const std::string& domain) override {
        isActiveCalls++;
        return active;
    }

    SnapshotHandle createSnapshot(const std::string& domain, const SnapshotDescriptor& descriptor,
                                  unsigned int flags) override {
        createSnapshotCalls++;
        if (hostFaultOnSnapshot) {
            throw HostFault{"createSnapshot"};
        }
        if (failCreateSnapshot) {
            throw ProviderError("snapshot creation refused");
        }
        lastDescriptor = descriptor;
        lastSnapshotFlags = flags;
        return SnapshotHandle{descriptor.name};
    }

    void startBlockCommit(const std::string& domain, const std::string& device, const std::string& base,
                          const std::string& top, unsigned long bandwidth, unsigned int flags) override {
        if (device == hostFaultCommitDevice) {
            throw HostFault{"startBlockCommit"};
        }
        if (device == failCommitDevice) {
            throw ProviderError("block commit refused for " + device);
        }
        commitCalls.push_back(CommitCall{device, base, top, bandwidth, flags});
    }

    BlockJobStatus blockJobStatus(const std::string& domain, const std::string& device) override {
        statusCalls[device]++;

        auto stuck = stuckJobs.find(device);
        if (stuck != stuckJobs.end()) {
            return stuck->second;
        }

        auto& script = jobScripts[device];
        if (script.empty()) {
            return noJob();
        }
        BlockJobStatus status = script.front();
        script.pop_front();
        return status;
    }

    void abortBlockJob(const std::string& domain, const std::string& device, bool pivot) override {
        abortCalls.push_back(AbortCall{device, pivot});
    }
};
