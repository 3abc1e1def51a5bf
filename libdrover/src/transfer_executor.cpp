#include "transfer_executor.h"
#include "drover_log.h"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace drover {

namespace {

constexpr const char* STAGING_SUFFIX = ".drover-partial";

std::string base_name(const std::string& path) {
    fs::path p(path);
    if (!p.has_filename()) p = p.parent_path();   // tolerate a trailing slash
    return p.filename().string();
}

TransferResult fail(TransferStatus status, std::string message) {
    return TransferResult{status, std::move(message)};
}

void discard_staging(const fs::path& staging) {
    std::error_code ec;
    fs::remove_all(staging, ec);
    if (ec) {
        DROVER_LOG_WARN("could not remove partial copy %s: %s",
                        staging.c_str(), ec.message().c_str());
    }
}

} // anonymous namespace

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::OK:                 return "ok";
        case TransferStatus::SOURCE_MISSING:     return "source missing";
        case TransferStatus::DESTINATION_EXISTS: return "destination exists";
        case TransferStatus::TRANSFER_FAILED:    return "transfer failed";
        case TransferStatus::CLEANUP_FAILED:     return "source cleanup failed";
    }
    return "unknown";
}

std::string target_path(const Assignment& assignment) {
    return (fs::path(assignment.destination) / base_name(assignment.source)).string();
}

std::string staging_path(const Assignment& assignment) {
    return (fs::path(assignment.destination) /
            ("." + base_name(assignment.source) + STAGING_SUFFIX)).string();
}

TransferResult transfer(const Assignment& assignment, ITransferOperation& op) {
    const fs::path source(assignment.source);
    const fs::path target(target_path(assignment));
    const fs::path staging(staging_path(assignment));

    std::error_code ec;
    fs::file_status source_status = fs::symlink_status(source, ec);
    if (!fs::status_known(source_status)) {
        return fail(TransferStatus::TRANSFER_FAILED,
                    "stat " + source.string() + ": " + ec.message());
    }
    if (!fs::exists(source_status)) {
        return fail(TransferStatus::SOURCE_MISSING, assignment.source + " does not exist");
    }

    fs::file_status target_status = fs::symlink_status(target, ec);
    if (!fs::status_known(target_status)) {
        return fail(TransferStatus::TRANSFER_FAILED,
                    "stat " + target.string() + ": " + ec.message());
    }
    if (fs::exists(target_status)) {
        return fail(TransferStatus::DESTINATION_EXISTS,
                    target.string() + " already exists, resolve it by hand");
    }

    // A leftover staging directory is only useful to an operation that resumes.
    if (!op.preserves_partial() && fs::exists(fs::symlink_status(staging, ec))) {
        DROVER_LOG_WARN("removing stale partial copy %s", staging.c_str());
        discard_staging(staging);
    }

    std::string error;
    if (!op.run(source.string(), staging.string(), error)) {
        if (!op.preserves_partial()) {
            discard_staging(staging);
        }
        return fail(TransferStatus::TRANSFER_FAILED, error);
    }

    fs::rename(staging, target, ec);
    if (ec) {
        if (!op.preserves_partial()) {
            discard_staging(staging);
        }
        return fail(TransferStatus::TRANSFER_FAILED,
                    "rename into " + target.string() + ": " + ec.message());
    }

    fs::remove_all(source, ec);
    if (ec) {
        return fail(TransferStatus::CLEANUP_FAILED,
                    "remove " + source.string() + ": " + ec.message());
    }

    return TransferResult{};
}

} // namespace drover
