#pragma once

#include "rps/Constants.hpp"
#include "rps/Types.hpp"
#include "rps/WeightMatrix.hpp"

#include <Eigen/Core>

#include <optional>
#include <random>
#include <string>

namespace rps {

/*
 * The adaptive opponent. Owns a WeightMatrix of depth-1 transition evidence between history
 * states, and plays the counter of the move that the matrix predicts the player will throw next.
 *
 * Each MarkovEngine instance is independent: concurrent matches must each use their own instance.
 * Not thread-safe.
 *
 * Per round, the caller must:
 *
 * 1. call decide(previous, prng) to get the computer's move,
 * 2. score the round with Game::Rules::evaluate() and build the new state with
 *    Game::Rules::encode(),
 * 3. call reinforce(previous, new_state), and only then replace previous with new_state.
 */
class MarkovEngine {
 public:
  using BucketArray = Eigen::Array<double, kNumMoves, 1>;
  using update_result_t = WeightMatrix::update_result_t;

  struct Params : public LearningRates {
    auto make_options_description();
  };

  // Throws util::CleanException if the learning rates are invalid.
  explicit MarkovEngine(const Params& params);
  MarkovEngine();

  /*
   * If previous is Empty, returns a uniformly random move drawn from prng. Otherwise, returns the
   * counter of the predicted next player move (see prediction()). prng is only consumed in the
   * Empty case.
   */
  Move decide(const HistoryState& previous, std::mt19937& prng) const;

  /*
   * Bucket sums of row previous: entry m is the total weight of next-states in which the player
   * throws m. The predicted move is the argmax, lowest index on ties.
   *
   * Throws InvalidStateIndex if previous is Empty.
   */
  BucketArray prediction(const HistoryState& previous) const;
  Move predicted_move(const HistoryState& previous) const;

  // "rock=0.403 paper=0.303 scissors=0.303 -> rock", or "none" if previous is Empty.
  std::string describe_prediction(const HistoryState& previous) const;

  /*
   * Applies the reinforcement rule to row previous for the observed transition, and returns the
   * guard's verdict. If previous is Empty there is no row to update: returns std::nullopt.
   *
   * Throws InvalidStateIndex if observed is Empty.
   */
  std::optional<update_result_t> reinforce(const HistoryState& previous,
                                           const HistoryState& observed);

  const Params& params() const { return params_; }
  const WeightMatrix& weights() const { return weights_; }

 private:
  const Params params_;
  WeightMatrix weights_;
};

}  // namespace rps

#include "inline/rps/MarkovEngine.inl"
