#pragma once

#include "clone/transaction_stage.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

class VMCloneError : public std::runtime_error {
public:
    explicit VMCloneError(const std::string& message) : std::runtime_error(message) {}
};

// An operation was called outside the stage (or stage range) it requires
class StageError : public VMCloneError {
public:
    StageError(const std::string& expected, TransactionStage actual);

    const std::string& expected() const { return expected_; }
    TransactionStage actual() const { return actual_; }

private:
    std::string expected_;
    TransactionStage actual_;
};

// Illegal combination of settings found while building the snapshot descriptor
class ConfigurationError : public VMCloneError {
public:
    explicit ConfigurationError(const std::string& message) : VMCloneError(message) {}
};

// The domain configuration payload could not be understood
class DescriptorError : public VMCloneError {
public:
    explicit DescriptorError(const std::string& message) : VMCloneError(message) {}
};

// Failure reported by the hypervisor
class ProviderError : public VMCloneError {
public:
    explicit ProviderError(const std::string& message) : VMCloneError(message) {}
};

class CommitTimeoutError : public ProviderError {
public:
    CommitTimeoutError(const std::string& device, long long timeoutMs);

    const std::string& device() const { return device_; }

private:
    std::string device_;
};

// The commit succeeded but some delta files could not be deleted
class CleanupAggregateError : public VMCloneError {
public:
    CleanupAggregateError(std::vector<std::string> failedPaths, const std::string& firstCause);

    std::size_t failureCount() const { return failedPaths_.size(); }
    const std::vector<std::string>& failedPaths() const { return failedPaths_; }
    const std::string& firstCause() const { return firstCause_; }

private:
    std::vector<std::string> failedPaths_;
    std::string firstCause_;
};

// An external copy utility failed
class CopyError : public VMCloneError {
public:
    explicit CopyError(const std::string& message) : VMCloneError(message) {}
};
