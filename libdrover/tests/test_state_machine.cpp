#include <catch2/catch.hpp>
#include "state_machine.h"
#include <string>
#include <vector>
#include <utility>

using namespace drover;

TEST_CASE("Initial state is IDLE") {
    StateMachine sm;
    REQUIRE(sm.state() == State::IDLE);
    REQUIRE_FALSE(is_terminal(sm.state()));
}

TEST_CASE("A full round returns to DECIDING and can loop") {
    StateMachine sm;
    REQUIRE(sm.transition(State::SCANNING));
    REQUIRE(sm.transition(State::MATCHING));
    REQUIRE(sm.transition(State::TRANSFERRING));
    REQUIRE(sm.transition(State::DECIDING));
    REQUIRE(sm.transition(State::SCANNING));
    REQUIRE(sm.state() == State::SCANNING);
}

TEST_CASE("No candidates ends scanning in SOURCES_EXHAUSTED") {
    StateMachine sm;
    sm.transition(State::SCANNING);
    REQUIRE(sm.transition(State::SOURCES_EXHAUSTED));
    REQUIRE(is_terminal(sm.state()));
}

TEST_CASE("No assignments ends matching in DESTINATIONS_EXHAUSTED") {
    StateMachine sm;
    sm.transition(State::SCANNING);
    sm.transition(State::MATCHING);
    REQUIRE(sm.transition(State::DESTINATIONS_EXHAUSTED));
    REQUIRE(is_terminal(sm.state()));
}

TEST_CASE("Skipping a phase is rejected") {
    StateMachine sm;
    REQUIRE_FALSE(sm.transition(State::TRANSFERRING));
    REQUIRE(sm.state() == State::IDLE);

    sm.transition(State::SCANNING);
    REQUIRE_FALSE(sm.transition(State::DECIDING));
    REQUIRE_FALSE(sm.transition(State::DESTINATIONS_EXHAUSTED));
    REQUIRE(sm.state() == State::SCANNING);
}

TEST_CASE("Transfers cannot be abandoned mid-round") {
    StateMachine sm;
    sm.transition(State::SCANNING);
    sm.transition(State::MATCHING);
    sm.transition(State::TRANSFERRING);
    REQUIRE_FALSE(sm.transition(State::STOPPED));
    REQUIRE_FALSE(sm.transition(State::ABORTED));
    REQUIRE(sm.state() == State::TRANSFERRING);
}

TEST_CASE("Terminal states are final") {
    StateMachine sm;
    sm.transition(State::SCANNING);
    sm.transition(State::ABORTED);
    REQUIRE_FALSE(sm.transition(State::SCANNING));
    REQUIRE_FALSE(sm.transition(State::IDLE));
    REQUIRE(sm.state() == State::ABORTED);
}

TEST_CASE("Stop is honoured between rounds only") {
    StateMachine sm;
    sm.transition(State::SCANNING);
    REQUIRE_FALSE(sm.transition(State::STOPPED));
    sm.transition(State::MATCHING);
    sm.transition(State::TRANSFERRING);
    sm.transition(State::DECIDING);
    REQUIRE(sm.transition(State::STOPPED));
}

TEST_CASE("State callback fires on transition") {
    StateMachine sm;
    std::vector<std::pair<State, State>> transitions;
    sm.set_callback([&](State o, State n) { transitions.push_back({o, n}); });

    sm.transition(State::SCANNING);
    sm.transition(State::MATCHING);

    REQUIRE(transitions.size() == 2);
    REQUIRE(transitions[0].first == State::IDLE);
    REQUIRE(transitions[1].second == State::MATCHING);
}

TEST_CASE("Rejected transitions do not fire callback") {
    StateMachine sm;
    int count = 0;
    sm.set_callback([&](State, State) { count++; });

    sm.transition(State::DECIDING);
    sm.transition(State::SOURCES_EXHAUSTED);
    REQUIRE(count == 0);
}

TEST_CASE("Every state has a name") {
    REQUIRE(std::string(state_name(State::SOURCES_EXHAUSTED)) == "sources exhausted");
    REQUIRE(std::string(state_name(State::DESTINATIONS_EXHAUSTED)) == "destinations exhausted");
    REQUIRE(std::string(state_name(State::TRANSFERRING)) == "transferring");
}
