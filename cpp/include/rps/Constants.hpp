#pragma once

namespace rps {

constexpr int kNumMoves = 3;
constexpr int kNumOutcomes = 3;

// One history state per (outcome, move) pair of the most recent round.
constexpr int kNumConcreteStates = kNumOutcomes * kNumMoves;

// Learning rates of the weight matrix.
constexpr double kDefaultDecreaseValue = 0.01;
constexpr double kDefaultIncreaseValue = 0.1;

// Match length and the score at which a match ends early.
constexpr int kDefaultNumRounds = 30;
constexpr int kDefaultScoreLimit = 10;

constexpr int kMaxNameLength = 32;

}  // namespace rps
