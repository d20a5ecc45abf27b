#pragma once

#include "rps/Constants.hpp"
#include "rps/Types.hpp"
#include "util/EigenUtil.hpp"

#include <cstdint>
#include <ostream>

namespace rps {

/*
 * Per-update step sizes of the WeightMatrix, and the bounds derived from them.
 *
 * A successful update subtracts decrease_value from each of the 9 cells of a row, then adds
 * increase_value to the observed cell. The guard bounds are:
 *
 * upper_limit = 1 - increase_value + decrease_value: the observed cell must not exceed this before
 *   the update, so that it stays <= 1 afterwards.
 * bottom_limit = decrease_value: every cell of the row must be at least this before the update, so
 *   that they all stay >= 0 afterwards.
 */
struct LearningRates {
  double decrease_value = kDefaultDecreaseValue;
  double increase_value = kDefaultIncreaseValue;

  double upper_limit() const { return 1.0 - increase_value + decrease_value; }
  double bottom_limit() const { return decrease_value; }

  // Throws util::CleanException unless 0 < decrease_value < increase_value < 1.
  void validate() const;
};

/*
 * 9x9 table of weights. Row = previous concrete state, column = next concrete state. Every cell
 * starts at 1/9.
 *
 * The weights are not renormalized after an update, so a row is a bounded weight vector rather than
 * a probability distribution; its sum drifts by (increase_value - 9 * decrease_value) per applied
 * update.
 */
class WeightMatrix {
 public:
  using Matrix = eigen_util::DMatrix<kNumConcreteStates, kNumConcreteStates>;
  using Row = Eigen::Matrix<double, 1, kNumConcreteStates>;

  enum update_result_t : int8_t {
    kApplied,
    kObservedAboveUpperLimit,  // row[observed] > upper_limit; row left unchanged
    kRowBelowBottomLimit       // min(row) < bottom_limit; row left unchanged
  };

  WeightMatrix();

  double weight(ConcreteState prev, ConcreteState next) const;
  Row row(ConcreteState prev) const;
  const Matrix& matrix() const { return matrix_; }

  /*
   * Nudges row prev toward the prev -> observed transition, provided that the guard allows it. A
   * single out-of-bounds cell freezes the whole row for this call.
   */
  update_result_t reinforce(ConcreteState prev, ConcreteState observed, const LearningRates& rates);

  // Sum of the 3 weights in row prev whose next-state has move-component m, for each m.
  Eigen::Array<double, kNumMoves, 1> move_buckets(ConcreteState prev) const;

  void print(std::ostream& os) const;

 private:
  Matrix matrix_;
};

}  // namespace rps

#include "inline/rps/WeightMatrix.inl"
