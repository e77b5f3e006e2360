#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

#include "internal/events/transition_event.hpp"

namespace {

using sessionkeeper::model::CanTransition;
using sessionkeeper::model::IsTerminal;
using sessionkeeper::model::ParseStatus;
using sessionkeeper::model::SessionStatus;

void TestLegalTransitions() {
  assert(CanTransition(SessionStatus::kActive, SessionStatus::kCompleted));
  assert(CanTransition(SessionStatus::kActive, SessionStatus::kFailed));
  assert(CanTransition(SessionStatus::kActive, SessionStatus::kAbandoned));
  assert(CanTransition(SessionStatus::kActive, SessionStatus::kResuming));
  assert(CanTransition(SessionStatus::kResuming, SessionStatus::kActive));
  assert(CanTransition(SessionStatus::kResuming, SessionStatus::kFailed));
}

void TestTerminalStatesHaveNoExits() {
  for (auto terminal : {SessionStatus::kCompleted, SessionStatus::kFailed, SessionStatus::kAbandoned}) {
    assert(IsTerminal(terminal));
    for (auto to : {SessionStatus::kActive, SessionStatus::kResuming, SessionStatus::kCompleted, SessionStatus::kFailed,
                    SessionStatus::kAbandoned}) {
      assert(!CanTransition(terminal, to));
    }
  }
  assert(!IsTerminal(SessionStatus::kActive));
  assert(!IsTerminal(SessionStatus::kResuming));
}

void TestResumingCannotBeAbandonedOrCompleted() {
  assert(!CanTransition(SessionStatus::kResuming, SessionStatus::kAbandoned));
  assert(!CanTransition(SessionStatus::kResuming, SessionStatus::kCompleted));
  assert(!CanTransition(SessionStatus::kResuming, SessionStatus::kResuming));
}

void TestParseRoundTripsNames() {
  for (auto status : {SessionStatus::kActive, SessionStatus::kResuming, SessionStatus::kCompleted, SessionStatus::kFailed,
                      SessionStatus::kAbandoned}) {
    auto parsed = ParseStatus(sessionkeeper::model::ToString(status));
    assert(parsed.has_value());
    assert(*parsed == status);
  }
  assert(!ParseStatus("ACTIVE").has_value());
  assert(!ParseStatus("").has_value());
}

void TestTransitionKindNames() {
  using sessionkeeper::events::TransitionKind;
  assert(sessionkeeper::events::ToString(TransitionKind::kResumeFailed) == "resume-failed");
  assert(sessionkeeper::events::ToString(TransitionKind::kHeartbeat) == "heartbeat");
}

} // namespace

int main() {
  TestLegalTransitions();
  TestTerminalStatesHaveNoExits();
  TestResumingCannotBeAbandonedOrCompleted();
  TestParseRoundTripsNames();
  TestTransitionKindNames();

  std::cout << "sessionkeeper_unit_state_machine: pass\n";
  return 0;
}
