#pragma once

#include <concepts>
#include <random>

/*
 * Helpers around <random>.
 *
 * There is no process-wide generator. --seed is parsed into a Params and handed to whoever owns
 * randomness (a Match, a RandomPlayer), which builds its own std::mt19937 with make_prng().
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  // A seed of 0 means seed with the current time.
  static std::mt19937 make_prng(int seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper), using prng.
   *
   * Throws util::Exception unless lower < upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);
};

}  // namespace util

#include "inline/util/Random.inl"
