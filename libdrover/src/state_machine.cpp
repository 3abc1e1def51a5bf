#include "state_machine.h"

#include <utility>

namespace drover {

const char* state_name(State s) {
    switch (s) {
        case State::IDLE:                   return "idle";
        case State::SCANNING:               return "scanning";
        case State::MATCHING:               return "matching";
        case State::TRANSFERRING:           return "transferring";
        case State::DECIDING:               return "deciding";
        case State::SOURCES_EXHAUSTED:      return "sources exhausted";
        case State::DESTINATIONS_EXHAUSTED: return "destinations exhausted";
        case State::ABORTED:                return "aborted";
        case State::STOPPED:                return "stopped";
    }
    return "unknown";
}

bool is_terminal(State s) {
    return s == State::SOURCES_EXHAUSTED
        || s == State::DESTINATIONS_EXHAUSTED
        || s == State::ABORTED
        || s == State::STOPPED;
}

StateMachine::StateMachine()
    : current_state_(State::IDLE)
    , callback_(nullptr)
{
}

State StateMachine::state() const {
    return current_state_;
}

void StateMachine::set_callback(StateCallback cb) {
    callback_ = std::move(cb);
}

bool StateMachine::allowed(State from, State to) {
    switch (from) {
        case State::IDLE:
            return to == State::SCANNING || to == State::STOPPED;
        case State::SCANNING:
            return to == State::MATCHING
                || to == State::SOURCES_EXHAUSTED
                || to == State::ABORTED;
        case State::MATCHING:
            return to == State::TRANSFERRING || to == State::DESTINATIONS_EXHAUSTED;
        case State::TRANSFERRING:
            return to == State::DECIDING;
        case State::DECIDING:
            return to == State::SCANNING || to == State::STOPPED;
        case State::SOURCES_EXHAUSTED:
        case State::DESTINATIONS_EXHAUSTED:
        case State::ABORTED:
        case State::STOPPED:
            return false;
    }
    return false;
}

bool StateMachine::transition(State next) {
    if (!allowed(current_state_, next)) return false;

    State old = current_state_;
    current_state_ = next;
    if (callback_) {
        callback_(old, next);
    }
    return true;
}

} // namespace drover
