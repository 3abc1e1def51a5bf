#include "candidate_selector.h"
#include "drover_log.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace drover {

bool SizeFilter::matches_name(const std::string& name) const {
    return name.compare(0, prefix.size(), prefix) == 0;
}

bool SizeFilter::matches_size(uint64_t size) const {
    return min_size <= size && size < max_size;
}

SelectResult select_candidate(const std::string& source_root,
                              const SizeFilter& filter,
                              ISizeProbe& probe) {
    SelectResult result;

    std::error_code ec;
    fs::directory_iterator it(source_root, ec);
    if (ec) {
        DROVER_LOG_WARN("cannot list source %s: %s", source_root.c_str(), ec.message().c_str());
        return result;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();
        if (!filter.matches_name(name)) continue;

        std::error_code type_ec;
        if (entry.is_symlink(type_ec) || !entry.is_directory(type_ec)) continue;

        std::string child = entry.path().string();
        std::error_code size_ec;
        uint64_t size = probe.subtree_size(child, size_ec);
        if (size_ec) {
            result.status = SelectStatus::PROBE_FAILED;
            result.path = child;
            result.error = "size of " + child + ": " + size_ec.message();
            return result;
        }

        DROVER_LOG_DEBUG("%s: %llu bytes", child.c_str(), static_cast<unsigned long long>(size));
        if (filter.matches_size(size)) {
            result.status = SelectStatus::FOUND;
            result.path = child;
            return result;
        }
    }

    if (ec) {
        DROVER_LOG_WARN("listing of %s stopped early: %s", source_root.c_str(), ec.message().c_str());
    }
    return result;
}

} // namespace drover
