#include "failure_ledger.h"

#include <fstream>

namespace drover {

bool FailureLedger::record(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!index_.insert(path).second) return false;
    ordered_.push_back(path);
    return true;
}

bool FailureLedger::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(path) != 0;
}

size_t FailureLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_.size();
}

std::vector<std::string> FailureLedger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_;
}

bool FailureLedger::save(const std::string& path) const {
    std::vector<std::string> snapshot = entries();

    std::ofstream f(path, std::ios::trunc);
    if (!f) return false;
    for (const auto& entry : snapshot) {
        f << entry << "\n";
    }
    f.flush();
    return f.good();
}

} // namespace drover
