#pragma once

#include <string>

// Stages of a transaction from UNINITIALIZED to FINISHED. FAILED is only
// reachable from BEGUN or COMMITTING and nothing leaves it.
enum class TransactionStage {
    FAILED = -1,

    // Nothing has been read from the hypervisor yet
    UNINITIALIZED = 0,

    // Domain name and configuration are available
    INITIALIZED = 1,

    // Selected disks and the snapshot descriptor are available
    PREPARED = 2,

    // The snapshot has been taken
    BEGUN = 3,

    // Deltas are being merged back into their base images
    COMMITTING = 4,

    // Committed and finished
    FINISHED = 5
};

std::string toString(TransactionStage stage);
