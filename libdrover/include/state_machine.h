#pragma once

#include <functional>

namespace drover {

enum class State {
    IDLE,
    SCANNING,
    MATCHING,
    TRANSFERRING,
    DECIDING,
    SOURCES_EXHAUSTED,
    DESTINATIONS_EXHAUSTED,
    ABORTED,
    STOPPED
};

const char* state_name(State s);
bool is_terminal(State s);

// Callback: (old_state, new_state)
using StateCallback = std::function<void(State, State)>;

class StateMachine {
public:
    StateMachine();

    State state() const;

    // Returns false (and stays put) if next is not reachable from the
    // current state.
    bool transition(State next);

    void set_callback(StateCallback cb);

private:
    static bool allowed(State from, State to);

    State current_state_;
    StateCallback callback_;
};

} // namespace drover
