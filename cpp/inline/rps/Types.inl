#include "rps/Types.hpp"

#include "rps/Exceptions.hpp"

namespace rps {

inline void validate(Move move) {
  if (move < 0 || move >= kNumMoves) {
    throw InvalidMoveValue("Invalid move value: {}", int(move));
  }
}

inline void validate(RoundOutcome outcome) {
  if (outcome < 0 || outcome >= kNumOutcomes) {
    throw InvalidOutcomeValue("Invalid round outcome value: {}", int(outcome));
  }
}

inline void validate(ConcreteState state) {
  if (state < 0 || state >= kNumConcreteStates) {
    throw InvalidStateIndex("Invalid state index: {}", int(state));
  }
}

inline Move to_move(int value) {
  if (value < 0 || value >= kNumMoves) {
    throw InvalidMoveValue("Invalid move value: {}", value);
  }
  return Move(value);
}

inline RoundOutcome to_outcome(int value) {
  if (value < 0 || value >= kNumOutcomes) {
    throw InvalidOutcomeValue("Invalid round outcome value: {}", value);
  }
  return RoundOutcome(value);
}

inline ConcreteState to_concrete_state(int index) {
  if (index < 0 || index >= kNumConcreteStates) {
    throw InvalidStateIndex("Invalid state index: {}", index);
  }
  return ConcreteState(index);
}

inline HistoryState::HistoryState(ConcreteState state) {
  validate(state);
  state_ = state;
}

inline ConcreteState HistoryState::concrete() const {
  if (is_empty()) {
    throw InvalidStateIndex("Empty history state used as a matrix coordinate");
  }
  return *state_;
}

inline Move HistoryState::move() const { return Move(concrete() % kNumMoves); }

inline RoundOutcome HistoryState::outcome() const {
  return RoundOutcome(concrete() / kNumMoves);
}

}  // namespace rps
