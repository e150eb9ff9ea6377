#include "clone/clone_errors.hpp"
#include <utility>

std::string toString(TransactionStage stage) {
    switch (stage) {
        case TransactionStage::FAILED:        return "FAILED";
        case TransactionStage::UNINITIALIZED: return "UNINITIALIZED";
        case TransactionStage::INITIALIZED:   return "INITIALIZED";
        case TransactionStage::PREPARED:      return "PREPARED";
        case TransactionStage::BEGUN:         return "BEGUN";
        case TransactionStage::COMMITTING:    return "COMMITTING";
        case TransactionStage::FINISHED:      return "FINISHED";
        default:                              return "UNKNOWN";
    }
}

StageError::StageError(const std::string& expected, TransactionStage actual)
    : VMCloneError("Stage " + expected + " is expected instead of " + toString(actual))
    , expected_(expected)
    , actual_(actual) {
}

CommitTimeoutError::CommitTimeoutError(const std::string& device, long long timeoutMs)
    : ProviderError("Block commit of device " + device + " did not finish within " +
                    std::to_string(timeoutMs) + " ms")
    , device_(device) {
}

CleanupAggregateError::CleanupAggregateError(std::vector<std::string> failedPaths, const std::string& firstCause)
    : VMCloneError("Failed in deleting " + std::to_string(failedPaths.size()) + " files: " + firstCause)
    , failedPaths_(std::move(failedPaths))
    , firstCause_(firstCause) {
}
