#pragma once

#include "rps/Constants.hpp"
#include "rps/Types.hpp"
#include "rps/players/AbstractPlayer.hpp"
#include "util/Random.hpp"

#include <random>

namespace rps {

// RandomPlayer always chooses uniformly at random, from a prng of its own.
class RandomPlayer : public AbstractPlayer {
 public:
  explicit RandomPlayer(int seed) : prng_(util::Random::make_prng(seed)) {}

  Move get_move() override { return Move(util::Random::uniform_sample(prng_, 0, kNumMoves)); }

 private:
  std::mt19937 prng_;
};

}  // namespace rps
