#pragma once

#include "clone/clone_config.hpp"
#include "clone/clone_types.hpp"
#include "clone/disk_selector.hpp"
#include "clone/hypervisor_client.hpp"
#include "clone/snapshot_spec_builder.hpp"
#include "clone/transaction_stage.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Snapshot-and-commit transaction over the disks of one domain.
//
// Driven in order: initialize(), prepare(), begin(), then the caller copies
// the base images listed by snapshotDisks(), then commit(). Each step
// requires the stage left by the previous one and throws StageError
// otherwise. A failure while BEGUN or COMMITTING moves the transaction to
// FAILED for good; a new transaction is needed to try again.
//
// Not safe for concurrent use.
class VMTransaction {
public:
    VMTransaction(std::shared_ptr<HypervisorClient> client,
                  const std::string& domain,
                  const TransactionConfig& config = TransactionConfig());

    VMTransaction(const VMTransaction&) = delete;
    VMTransaction& operator=(const VMTransaction&) = delete;

    // Reads and parses the domain configuration
    void initialize();

    // Selects disks and builds the snapshot descriptor. Throws
    // ConfigurationError and stays INITIALIZED when the settings cannot
    // be satisfied.
    void prepare();

    // Creates the external snapshot
    void begin();

    // Merges every delta back into its base image, pivots, and deletes the
    // delta files. Throws CleanupAggregateError when only the deletion
    // failed; the stage is FINISHED in that case.
    void commit();

    TransactionStage stage() const { return stage_; }
    const std::string& domain() const { return domain_; }
    const TransactionConfig& config() const { return config_; }
    const std::string& workdir() const { return config_.workdir; }
    bool diskOnly() const { return config_.diskOnly; }
    bool quiesce() const { return config_.quiesce; }

    // Only allowed while UNINITIALIZED. A null selector restores the default.
    void setDiskSelector(std::shared_ptr<DiskSelector> selector);
    void setDiskFilter(FunctionDiskSelector::Predicate predicate);
    std::shared_ptr<DiskSelector> diskSelector() const { return selector_; }

    // From INITIALIZED
    const std::string& domainName() const;
    const DomainDescriptor& domainDescriptor() const;

    // From PREPARED
    const std::vector<DiskDescriptor>& selectedDisks() const;
    const std::vector<SnapshotDisk>& snapshotDisks() const;
    const SnapshotDescriptor& snapshotDescriptor() const;
    unsigned int snapshotFlags() const;

private:
    struct PreparedState {
        std::vector<DiskDescriptor> selectedDisks;
        std::vector<SnapshotDisk> snapshotDisks;
        SnapshotSpec spec;
    };

    void checkStage(TransactionStage expected) const;
    void checkStageBetween(TransactionStage start, TransactionStage end = TransactionStage::FINISHED) const;
    void checkReadable(TransactionStage start) const;
    void setStage(TransactionStage stage);

    void commitDisk(const DiskDelta& delta, bool active);
    void abandonCommit(const std::vector<std::string>& mergedFiles);
    void removeDeltaFiles(const std::vector<std::string>& paths) const;

    TransactionStage stage_{TransactionStage::UNINITIALIZED};
    std::shared_ptr<HypervisorClient> client_;
    std::string domain_;
    TransactionConfig config_;
    std::shared_ptr<DiskSelector> selector_;

    std::optional<DomainDescriptor> descriptor_;
    std::optional<PreparedState> prepared_;
    std::optional<SnapshotHandle> snapshot_;
};
