#pragma once

#include "size_probe.h"

#include <cstdint>
#include <string>

namespace drover {

struct SizeFilter {
    uint64_t min_size = 0;   // inclusive
    uint64_t max_size = 0;   // exclusive
    std::string prefix;      // empty matches every name

    bool matches_name(const std::string& name) const;
    bool matches_size(uint64_t size) const;
};

enum class SelectStatus {
    FOUND,
    NOT_FOUND,
    PROBE_FAILED
};

struct SelectResult {
    SelectStatus status = SelectStatus::NOT_FOUND;
    std::string path;   // candidate (FOUND) or the child that failed (PROBE_FAILED)
    std::string error;
};

// Return the first child directory of source_root that passes the filter.
// Children are visited in directory-entry order, which the OS does not
// guarantee to be stable; no sorting is applied. Symlinks to directories are
// not candidates. A size probe failure ends the scan with PROBE_FAILED
// instead of moving on to the next child.
SelectResult select_candidate(const std::string& source_root,
                              const SizeFilter& filter,
                              ISizeProbe& probe);

} // namespace drover
