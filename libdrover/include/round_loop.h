#pragma once

#include "candidate_selector.h"
#include "failure_ledger.h"
#include "matcher.h"
#include "size_probe.h"
#include "state_machine.h"
#include "transfer_executor.h"
#include "transfer_operation.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace drover {

struct RoundLoopConfig {
    std::vector<std::string> source_paths;
    std::vector<std::string> destination_paths;
    SizeFilter filter;
    int max_parallel_transfers = 0;   // 0 = one thread per assignment, no cap
};

enum class TransferPhase {
    STARTED,
    FINISHED
};

struct TransferEvent {
    TransferPhase phase;
    Assignment assignment;
    TransferResult result;   // meaningful for FINISHED only
};

// Both callbacks may run on transfer threads, concurrently with each other.
using TransferCallback = std::function<void(const TransferEvent&)>;
// Polled at the start of each round, after the previous round's barrier.
using StopPredicate = std::function<bool()>;

/**
 * Drives rounds of scan -> match -> transfer -> decide until the sources or
 * destinations run out. Every assignment of a round runs on its own thread
 * and the round does not end until all of them have finished. Sources whose
 * transfer failed go into the ledger and are never scheduled again.
 */
class RoundLoop {
public:
    RoundLoop(RoundLoopConfig config, ISizeProbe& probe, ITransferOperation& op);

    // Non-copyable
    RoundLoop(const RoundLoop&) = delete;
    RoundLoop& operator=(const RoundLoop&) = delete;

    State state() const;

    // Run one round. Returns DECIDING if another round should follow,
    // otherwise the terminal state reached. Does nothing once terminal.
    State run_round();

    // Run rounds until a terminal state.
    State run();

    // Scanning and matching only; nothing is moved and the state is unchanged.
    MatchResult plan();

    void set_state_callback(StateCallback cb);
    void set_transfer_callback(TransferCallback cb);
    void set_stop_predicate(StopPredicate pred);

    const FailureLedger& ledger() const;
    int rounds_completed() const;
    size_t transfers_succeeded() const;

    // Reason for ABORTED, empty otherwise.
    const std::string& error() const;

private:
    void transfer_all(const std::vector<Assignment>& assignments);
    void transfer_one(const Assignment& assignment);
    void notify(const TransferEvent& event);

    RoundLoopConfig config_;
    ISizeProbe& probe_;
    ITransferOperation& op_;

    StateMachine state_machine_;
    FailureLedger ledger_;
    TransferCallback transfer_cb_;
    StopPredicate stop_requested_;

    int rounds_completed_ = 0;
    std::atomic<size_t> transfers_succeeded_{0};
    std::string error_;
};

} // namespace drover
