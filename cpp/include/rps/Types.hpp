#pragma once

#include "rps/Constants.hpp"

#include <cstdint>
#include <optional>

namespace rps {

// Values double as indices: the move v beats (v + 2) % 3 and loses to (v + 1) % 3.
enum Move : int8_t { kRock, kPaper, kScissors };

// Always from the player's perspective.
enum RoundOutcome : int8_t { kWin, kLoss, kTie };

// Outcome-major: index = outcome * kNumMoves + move. Row/column coordinate of the WeightMatrix.
enum ConcreteState : int8_t {
  kWinWithRock,
  kWinWithPaper,
  kWinWithScissors,
  kLossWithRock,
  kLossWithPaper,
  kLossWithScissors,
  kTieWithRock,
  kTieWithPaper,
  kTieWithScissors
};

// Throw InvalidMoveValue / InvalidOutcomeValue / InvalidStateIndex on out-of-domain values.
void validate(Move move);
void validate(RoundOutcome outcome);
void validate(ConcreteState state);

// Checked conversions from raw integers.
Move to_move(int value);
RoundOutcome to_outcome(int value);
ConcreteState to_concrete_state(int index);

/*
 * What the player threw in the most recent round, and how that round ended for them. Before the
 * first round there is no such information, which is represented by the Empty HistoryState.
 *
 * Only a concrete state can address the WeightMatrix: concrete() throws InvalidStateIndex on
 * Empty, and the matrix API only accepts ConcreteState.
 */
class HistoryState {
 public:
  static HistoryState empty() { return HistoryState(); }
  explicit HistoryState(ConcreteState state);

  bool is_empty() const { return !state_.has_value(); }
  ConcreteState concrete() const;
  Move move() const;
  RoundOutcome outcome() const;

  bool operator==(const HistoryState&) const = default;

 private:
  HistoryState() = default;

  std::optional<ConcreteState> state_;
};

}  // namespace rps

#include "inline/rps/Types.inl"
