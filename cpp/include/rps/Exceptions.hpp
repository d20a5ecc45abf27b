#pragma once

#include "util/Exception.hpp"

namespace rps {

/*
 * The exceptions below signal contract violations by the caller of the core model: a value outside
 * of its domain was passed in. They are never used for the reinforcement guard, which is a normal
 * outcome of WeightMatrix::reinforce().
 */

// A Move outside of {kRock, kPaper, kScissors}.
class InvalidMoveValue : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A RoundOutcome outside of {kWin, kLoss, kTie}.
class InvalidOutcomeValue : public util::Exception {
 public:
  using util::Exception::Exception;
};

// An Empty HistoryState, or an index outside [0, kNumConcreteStates), used as a matrix coordinate.
class InvalidStateIndex : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace rps
