#include "rps/WeightMatrix.hpp"

#include "rps/Game.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"

#include <string>
#include <vector>

namespace rps {

inline void LearningRates::validate() const {
  if (!(decrease_value > 0)) {
    throw util::CleanException("decrease-value must be positive (got {})", decrease_value);
  }
  if (!(increase_value > decrease_value)) {
    throw util::CleanException("increase-value ({}) must be greater than decrease-value ({})",
                               increase_value, decrease_value);
  }
  if (!(increase_value < 1)) {
    throw util::CleanException("increase-value must be less than 1 (got {})", increase_value);
  }
}

inline WeightMatrix::WeightMatrix() { matrix_.setConstant(1.0 / kNumConcreteStates); }

inline double WeightMatrix::weight(ConcreteState prev, ConcreteState next) const {
  rps::validate(prev);
  rps::validate(next);
  return matrix_(prev, next);
}

inline WeightMatrix::Row WeightMatrix::row(ConcreteState prev) const {
  rps::validate(prev);
  return matrix_.row(prev);
}

inline WeightMatrix::update_result_t WeightMatrix::reinforce(ConcreteState prev,
                                                             ConcreteState observed,
                                                             const LearningRates& rates) {
  rps::validate(prev);
  rps::validate(observed);

  auto r = matrix_.row(prev);
  if (r(observed) > rates.upper_limit()) {
    return kObservedAboveUpperLimit;
  }
  if (r.minCoeff() < rates.bottom_limit()) {
    return kRowBelowBottomLimit;
  }

  r.array() -= rates.decrease_value;
  r(observed) += rates.increase_value;

  DEBUG_ASSERT(r.minCoeff() >= 0 && r.maxCoeff() <= 1 + 1e-9, "row {} out of [0, 1] after update",
               int(prev));
  return kApplied;
}

inline Eigen::Array<double, kNumMoves, 1> WeightMatrix::move_buckets(ConcreteState prev) const {
  rps::validate(prev);

  // Row-major storage: the row is a contiguous outcome-major 3x3 block, one column per move.
  using Grid = Eigen::Matrix<double, kNumOutcomes, kNumMoves, Eigen::RowMajor>;
  Eigen::Map<const Grid> grid(matrix_.row(prev).data());
  return grid.colwise().sum().transpose().array();
}

inline void WeightMatrix::print(std::ostream& os) const {
  std::vector<std::string> labels;
  for (int s = 0; s < kNumConcreteStates; ++s) {
    labels.push_back(Game::IO::state_label(ConcreteState(s)));
  }
  eigen_util::print_matrix(os, matrix_, labels, labels);
}

}  // namespace rps
