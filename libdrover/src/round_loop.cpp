#include "round_loop.h"
#include "drover_log.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace drover {

namespace {

// Counting gate for max_parallel_transfers. A limit <= 0 never blocks.
class TransferGate {
public:
    explicit TransferGate(int limit) : limit_(limit) {}

    void acquire() {
        if (limit_ <= 0) return;
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return active_ < limit_; });
        ++active_;
    }

    void release() {
        if (limit_ <= 0) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        cv_.notify_one();
    }

private:
    int limit_;
    int active_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // anonymous namespace

RoundLoop::RoundLoop(RoundLoopConfig config, ISizeProbe& probe, ITransferOperation& op)
    : config_(std::move(config))
    , probe_(probe)
    , op_(op)
{
}

State RoundLoop::state() const {
    return state_machine_.state();
}

void RoundLoop::set_state_callback(StateCallback cb) {
    state_machine_.set_callback(std::move(cb));
}

void RoundLoop::set_transfer_callback(TransferCallback cb) {
    transfer_cb_ = std::move(cb);
}

void RoundLoop::set_stop_predicate(StopPredicate pred) {
    stop_requested_ = std::move(pred);
}

const FailureLedger& RoundLoop::ledger() const {
    return ledger_;
}

int RoundLoop::rounds_completed() const {
    return rounds_completed_;
}

size_t RoundLoop::transfers_succeeded() const {
    return transfers_succeeded_.load();
}

const std::string& RoundLoop::error() const {
    return error_;
}

MatchResult RoundLoop::plan() {
    return match_round(config_.source_paths, config_.destination_paths,
                       config_.filter, ledger_, probe_);
}

State RoundLoop::run_round() {
    if (is_terminal(state())) return state();

    if (stop_requested_ && stop_requested_()) {
        state_machine_.transition(State::STOPPED);
        return state();
    }

    // Scanning
    state_machine_.transition(State::SCANNING);
    std::vector<std::string> candidates;
    if (!collect_candidates(config_.source_paths, config_.filter, ledger_, probe_,
                            candidates, error_)) {
        DROVER_LOG_ERROR("aborting: %s", error_.c_str());
        state_machine_.transition(State::ABORTED);
        return state();
    }
    if (candidates.empty()) {
        state_machine_.transition(State::SOURCES_EXHAUSTED);
        return state();
    }

    // Matching
    state_machine_.transition(State::MATCHING);
    std::vector<Assignment> assignments = assign_destinations(
        candidates, config_.destination_paths, config_.filter.max_size, probe_);
    if (assignments.empty()) {
        state_machine_.transition(State::DESTINATIONS_EXHAUSTED);
        return state();
    }
    DROVER_LOG("round %d: %zu candidate(s), %zu assignment(s)",
               rounds_completed_ + 1, candidates.size(), assignments.size());

    // Transferring
    state_machine_.transition(State::TRANSFERRING);
    transfer_all(assignments);

    // Deciding
    state_machine_.transition(State::DECIDING);
    ++rounds_completed_;
    return state();
}

State RoundLoop::run() {
    State s = state();
    while (!is_terminal(s)) {
        s = run_round();
    }
    return s;
}

void RoundLoop::transfer_all(const std::vector<Assignment>& assignments) {
    TransferGate gate(config_.max_parallel_transfers);
    std::vector<std::thread> workers;
    workers.reserve(assignments.size());

    for (const auto& assignment : assignments) {
        auto work = [this, &gate, assignment]() {
            gate.acquire();
            transfer_one(assignment);
            gate.release();
        };
        try {
            workers.emplace_back(work);
        } catch (const std::system_error& e) {
            DROVER_LOG_WARN("cannot start thread (%s), transferring %s inline",
                            e.what(), assignment.source.c_str());
            work();
        }
    }

    // Round barrier
    for (auto& w : workers) {
        w.join();
    }
}

void RoundLoop::transfer_one(const Assignment& assignment) {
    notify(TransferEvent{TransferPhase::STARTED, assignment, TransferResult{}});

    TransferResult result;
    try {
        result = transfer(assignment, op_);
    } catch (const std::exception& e) {
        result = TransferResult{TransferStatus::TRANSFER_FAILED, e.what()};
    }

    if (result.ok()) {
        transfers_succeeded_.fetch_add(1);
        DROVER_LOG("%s -> %s done", assignment.source.c_str(), assignment.destination.c_str());
    } else {
        ledger_.record(assignment.source);
        DROVER_LOG_ERROR("%s -> %s failed (%s): %s",
                         assignment.source.c_str(), assignment.destination.c_str(),
                         transfer_status_name(result.status), result.message.c_str());
    }

    notify(TransferEvent{TransferPhase::FINISHED, assignment, result});
}

void RoundLoop::notify(const TransferEvent& event) {
    if (!transfer_cb_) return;
    try {
        transfer_cb_(event);
    } catch (const std::exception& e) {
        DROVER_LOG_ERROR("transfer callback for %s failed: %s",
                         event.assignment.source.c_str(), e.what());
    }
}

} // namespace drover
