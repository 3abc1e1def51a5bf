#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace drover {

/**
 * Source paths that failed to transfer during this process lifetime.
 * Entries are never removed and nothing is loaded from disk: a source that
 * failed once stays excluded until the process restarts.
 * All members are safe to call from concurrent transfer tasks.
 */
class FailureLedger {
public:
    // Returns true if path was not recorded before.
    bool record(const std::string& path);

    bool contains(const std::string& path) const;
    size_t size() const;

    // Entries in the order they were first recorded.
    std::vector<std::string> entries() const;

    // Write one path per line. Returns false on write error.
    bool save(const std::string& path) const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> index_;
    std::vector<std::string> ordered_;
};

} // namespace drover
