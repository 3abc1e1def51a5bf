#pragma once

#include "matcher.h"
#include "transfer_operation.h"

#include <string>

namespace drover {

enum class TransferStatus {
    OK,
    SOURCE_MISSING,
    DESTINATION_EXISTS,
    TRANSFER_FAILED,
    CLEANUP_FAILED      // destination complete, source could not be removed
};

struct TransferResult {
    TransferStatus status = TransferStatus::OK;
    std::string message;

    bool ok() const { return status == TransferStatus::OK; }
};

const char* transfer_status_name(TransferStatus status);

// <destination>/<basename(source)>
std::string target_path(const Assignment& assignment);

// <destination>/.<basename(source)>.drover-partial
std::string staging_path(const Assignment& assignment);

// Move assignment.source into assignment.destination through op.
// The operation fills a staging directory which is renamed into place on
// success; the source is removed only after that rename. On failure the
// staging directory is removed unless op.preserves_partial().
TransferResult transfer(const Assignment& assignment, ITransferOperation& op);

} // namespace drover
