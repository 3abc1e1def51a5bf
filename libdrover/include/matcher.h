#pragma once

#include "candidate_selector.h"
#include "failure_ledger.h"
#include "size_probe.h"

#include <string>
#include <vector>

namespace drover {

struct Assignment {
    std::string source;        // candidate directory
    std::string destination;   // destination root it moves into
};

enum class MatchStatus {
    ASSIGNED,
    SOURCES_EXHAUSTED,
    DESTINATIONS_EXHAUSTED,
    PROBE_FAILED
};

struct MatchResult {
    MatchStatus status = MatchStatus::SOURCES_EXHAUSTED;
    std::vector<std::string> candidates;
    std::vector<Assignment> assignments;
    std::string error;   // set for PROBE_FAILED
};

// Pick at most one candidate per source root, in configured order, leaving
// out anything already in the ledger. Returns false (with error set) if a
// subtree size could not be computed.
bool collect_candidates(const std::vector<std::string>& source_roots,
                        const SizeFilter& filter,
                        const FailureLedger& ledger,
                        ISizeProbe& probe,
                        std::vector<std::string>& candidates,
                        std::string& error);

// Greedy one-to-one pairing: destinations are walked in order and each one
// with free space strictly above max_size takes the next candidate. A failed
// free space query counts as zero. Repeated destination paths are used once.
std::vector<Assignment> assign_destinations(const std::vector<std::string>& candidates,
                                            const std::vector<std::string>& destination_roots,
                                            uint64_t max_size,
                                            ISizeProbe& probe);

// collect_candidates + assign_destinations for one round.
MatchResult match_round(const std::vector<std::string>& source_roots,
                        const std::vector<std::string>& destination_roots,
                        const SizeFilter& filter,
                        const FailureLedger& ledger,
                        ISizeProbe& probe);

} // namespace drover
