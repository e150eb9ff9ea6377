#include "clone/vm_transaction.hpp"
#include "clone/clone_errors.hpp"
#include "clone/descriptor_xml.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

VMTransaction::VMTransaction(std::shared_ptr<HypervisorClient> client,
                             const std::string& domain,
                             const TransactionConfig& config)
    : client_(std::move(client))
    , domain_(domain)
    , config_(config) {
    if (!client_) {
        throw std::invalid_argument("VMTransaction requires a hypervisor client");
    }
}

void VMTransaction::initialize() {
    checkStage(TransactionStage::UNINITIALIZED);

    std::string xml = client_->describe(domain_);
    descriptor_ = DescriptorXml::parseDomain(xml);

    Logger::debug("Domain " + descriptor_->name + " has " + std::to_string(descriptor_->disks.size()) + " disks");
    setStage(TransactionStage::INITIALIZED);
}

void VMTransaction::prepare() {
    checkStage(TransactionStage::INITIALIZED);

    std::shared_ptr<DiskSelector> selector = selector_ ? selector_ : std::make_shared<DefaultDiskSelector>();

    PreparedState state;
    for (const auto& disk : descriptor_->disks) {
        if (selector->select(disk)) {
            Logger::info("Accept disk <" + disk.deviceName + ", " + disk.deviceKind + ">");
            state.selectedDisks.push_back(disk);
            state.snapshotDisks.push_back(SnapshotDisk{disk.deviceName, disk.sourcePath, disk.sourceKind});
        }
    }

    state.spec = SnapshotSpecBuilder(config_).build(descriptor_->name, state.selectedDisks);

    prepared_ = std::move(state);
    setStage(TransactionStage::PREPARED);
}

void VMTransaction::begin() {
    checkStage(TransactionStage::PREPARED);

    try {
        const SnapshotSpec& spec = prepared_->spec;
        if (Logger::isEnabled(LogLevel::DEBUG)) {
            Logger::debug("Snapshot XML: " + DescriptorXml::formatSnapshot(spec.descriptor, true));
            Logger::debug("Snapshot flags: " + snapshotFlagNames(spec.flags));
        }

        snapshot_ = client_->createSnapshot(domain_, spec.descriptor, spec.flags);
        setStage(TransactionStage::BEGUN);
    } catch (const std::exception& e) {
        Logger::info(std::string("Failed to create snapshot: ") + e.what());
        setStage(TransactionStage::FAILED);
        throw;
    } catch (...) {
        Logger::info("Failed to create snapshot: unknown error");
        setStage(TransactionStage::FAILED);
        throw;
    }
}

void VMTransaction::commit() {
    checkStage(TransactionStage::BEGUN);

    std::vector<std::string> deletingFiles;
    try {
        setStage(TransactionStage::COMMITTING);

        bool active = client_->isActive(domain_);

        for (const auto& delta : prepared_->spec.descriptor.deltas) {
            commitDisk(delta, active);
            deletingFiles.push_back(delta.deltaPath);
        }

        setStage(TransactionStage::FINISHED);
    } catch (const std::exception& e) {
        Logger::error(std::string("Commit failed: ") + e.what());
        abandonCommit(deletingFiles);
        throw;
    } catch (...) {
        Logger::error("Commit failed: unknown error");
        abandonCommit(deletingFiles);
        throw;
    }

    removeDeltaFiles(deletingFiles);
}

void VMTransaction::abandonCommit(const std::vector<std::string>& mergedFiles) {
    setStage(TransactionStage::FAILED);

    // Deltas merged before the failure are no longer referenced
    try {
        removeDeltaFiles(mergedFiles);
    } catch (const CleanupAggregateError& cleanup) {
        Logger::warning(cleanup.what());
    }
}

void VMTransaction::commitDisk(const DiskDelta& delta, bool active) {
    const unsigned long bandwidth = 0;

    unsigned int flags = BLOCK_COMMIT_SHALLOW;
    if (active) {
        flags |= BLOCK_COMMIT_ACTIVE;
    }

    Logger::info("blockCommit: device " + delta.deviceName + " with bandwidth " + std::to_string(bandwidth) +
                 " and flags " + blockCommitFlagNames(flags));
    client_->startBlockCommit(domain_, delta.deviceName, "", delta.deltaPath, bandwidth, flags);

    const auto started = std::chrono::steady_clock::now();
    while (true) {
        BlockJobStatus status = client_->blockJobStatus(domain_, delta.deviceName);

        if (!status.hasJob()) {
            Logger::info("blockJobInfo: device " + delta.deviceName + " has no job left");
            return;
        }

        if (status.readyToPivot()) {
            client_->abortBlockJob(domain_, delta.deviceName, true);
            Logger::info("blockJobAbort: device " + delta.deviceName + " with pivot");
            return;
        }

        if (Logger::isEnabled(LogLevel::DEBUG)) {
            std::ostringstream progress;
            progress << "blockJobInfo: device " << delta.deviceName << " progress " << status.current << "/"
                     << status.end << " (" << std::fixed << std::setprecision(2)
                     << static_cast<double>(status.current) / static_cast<double>(status.end) << ")";
            Logger::debug(progress.str());
        }

        if (config_.commitTimeout.count() > 0 &&
            std::chrono::steady_clock::now() - started >= config_.commitTimeout) {
            throw CommitTimeoutError(delta.deviceName, config_.commitTimeout.count());
        }

        std::this_thread::sleep_for(config_.pollInterval);
    }
}

void VMTransaction::removeDeltaFiles(const std::vector<std::string>& paths) const {
    std::vector<std::string> failedPaths;
    std::string firstCause;

    for (const auto& path : paths) {
        std::error_code ec;
        bool removed = std::filesystem::remove(path, ec);
        if (removed && !ec) {
            Logger::debug("Removed delta file " + path);
            continue;
        }

        std::string cause = path + ": " + (ec ? ec.message() : std::string(std::strerror(ENOENT)));
        Logger::warning("Failed to remove delta file " + cause);
        if (failedPaths.empty()) {
            firstCause = cause;
        }
        failedPaths.push_back(path);
    }

    if (!failedPaths.empty()) {
        throw CleanupAggregateError(std::move(failedPaths), firstCause);
    }
}

void VMTransaction::setDiskSelector(std::shared_ptr<DiskSelector> selector) {
    checkStage(TransactionStage::UNINITIALIZED);
    selector_ = std::move(selector);
}

void VMTransaction::setDiskFilter(FunctionDiskSelector::Predicate predicate) {
    checkStage(TransactionStage::UNINITIALIZED);
    selector_ = makeDiskSelector(std::move(predicate));
}

const std::string& VMTransaction::domainName() const {
    checkReadable(TransactionStage::INITIALIZED);
    return descriptor_->name;
}

const DomainDescriptor& VMTransaction::domainDescriptor() const {
    checkReadable(TransactionStage::INITIALIZED);
    return *descriptor_;
}

const std::vector<DiskDescriptor>& VMTransaction::selectedDisks() const {
    checkReadable(TransactionStage::PREPARED);
    return prepared_->selectedDisks;
}

const std::vector<SnapshotDisk>& VMTransaction::snapshotDisks() const {
    checkReadable(TransactionStage::PREPARED);
    return prepared_->snapshotDisks;
}

const SnapshotDescriptor& VMTransaction::snapshotDescriptor() const {
    checkReadable(TransactionStage::PREPARED);
    return prepared_->spec.descriptor;
}

unsigned int VMTransaction::snapshotFlags() const {
    checkReadable(TransactionStage::PREPARED);
    return prepared_->spec.flags;
}

void VMTransaction::checkStage(TransactionStage expected) const {
    if (stage_ != expected) {
        throw StageError(toString(expected), stage_);
    }
}

void VMTransaction::checkStageBetween(TransactionStage start, TransactionStage end) const {
    if (stage_ < start || stage_ > end) {
        throw StageError("between " + toString(start) + " and " + toString(end), stage_);
    }
}

// FAILED is only reachable after PREPARED, so every payload is still there
void VMTransaction::checkReadable(TransactionStage start) const {
    if (stage_ == TransactionStage::FAILED) {
        return;
    }
    checkStageBetween(start);
}

void VMTransaction::setStage(TransactionStage stage) {
    stage_ = stage;
    Logger::debug("stage changed to " + toString(stage));
}
