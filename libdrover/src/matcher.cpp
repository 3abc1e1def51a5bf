#include "matcher.h"
#include "drover_log.h"

#include <unordered_set>

namespace drover {

bool collect_candidates(const std::vector<std::string>& source_roots,
                        const SizeFilter& filter,
                        const FailureLedger& ledger,
                        ISizeProbe& probe,
                        std::vector<std::string>& candidates,
                        std::string& error) {
    candidates.clear();

    for (const auto& root : source_roots) {
        SelectResult sel = select_candidate(root, filter, probe);
        if (sel.status == SelectStatus::PROBE_FAILED) {
            error = sel.error;
            return false;
        }
        if (sel.status == SelectStatus::NOT_FOUND) {
            DROVER_LOG_DEBUG("no eligible folder under %s", root.c_str());
            continue;
        }
        if (ledger.contains(sel.path)) {
            DROVER_LOG_DEBUG("skipping %s: failed earlier", sel.path.c_str());
            continue;
        }
        candidates.push_back(sel.path);
    }
    return true;
}

std::vector<Assignment> assign_destinations(const std::vector<std::string>& candidates,
                                            const std::vector<std::string>& destination_roots,
                                            uint64_t max_size,
                                            ISizeProbe& probe) {
    std::vector<Assignment> assignments;
    std::unordered_set<std::string> used;

    size_t index = 0;
    for (const auto& dest : destination_roots) {
        if (index >= candidates.size()) break;
        if (used.count(dest)) continue;

        uint64_t free_bytes = 0;
        auto probed = probe.free_space(dest);
        if (probed) {
            free_bytes = *probed;
        } else {
            DROVER_LOG_WARN("cannot query free space of %s, skipping", dest.c_str());
        }

        if (free_bytes > max_size) {
            assignments.push_back({candidates[index], dest});
            used.insert(dest);
            ++index;
        } else {
            DROVER_LOG_DEBUG("%s has %llu bytes free, not enough", dest.c_str(),
                             static_cast<unsigned long long>(free_bytes));
        }
    }
    return assignments;
}

MatchResult match_round(const std::vector<std::string>& source_roots,
                        const std::vector<std::string>& destination_roots,
                        const SizeFilter& filter,
                        const FailureLedger& ledger,
                        ISizeProbe& probe) {
    MatchResult result;

    if (!collect_candidates(source_roots, filter, ledger, probe, result.candidates, result.error)) {
        result.status = MatchStatus::PROBE_FAILED;
        return result;
    }
    if (result.candidates.empty()) {
        result.status = MatchStatus::SOURCES_EXHAUSTED;
        return result;
    }

    result.assignments = assign_destinations(result.candidates, destination_roots,
                                             filter.max_size, probe);
    result.status = result.assignments.empty() ? MatchStatus::DESTINATIONS_EXHAUSTED
                                               : MatchStatus::ASSIGNED;
    return result;
}

} // namespace drover
