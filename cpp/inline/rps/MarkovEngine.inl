#include "rps/MarkovEngine.hpp"

#include "rps/Game.hpp"
#include "util/BoostUtil.hpp"
#include "util/EigenUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>
#include <magic_enum/magic_enum.hpp>

#include <format>

namespace rps {

inline auto MarkovEngine::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("MarkovEngine options");
  return desc
    .template add_option<"decrease-value", 'd'>(
      po2::default_value("{:.3f}", &decrease_value),
      "amount subtracted from every cell of the touched row on each update (forgetting rate)")
    .template add_option<"increase-value", 'i'>(
      po2::default_value("{:.3f}", &increase_value),
      "amount added to the observed-transition cell on each update (reinforcement strength)");
}

inline MarkovEngine::MarkovEngine(const Params& params) : params_(params) { params_.validate(); }

inline MarkovEngine::MarkovEngine() : MarkovEngine(Params()) {}

inline Move MarkovEngine::decide(const HistoryState& previous, std::mt19937& prng) const {
  if (previous.is_empty()) {
    return Move(util::Random::uniform_sample(prng, 0, kNumMoves));
  }
  return Game::Rules::counter(predicted_move(previous));
}

inline MarkovEngine::BucketArray MarkovEngine::prediction(const HistoryState& previous) const {
  return weights_.move_buckets(previous.concrete());
}

inline Move MarkovEngine::predicted_move(const HistoryState& previous) const {
  return Move(eigen_util::argmax(prediction(previous)));
}

inline std::string MarkovEngine::describe_prediction(const HistoryState& previous) const {
  if (previous.is_empty()) {
    return "none";
  }
  BucketArray buckets = prediction(previous);
  return std::format("rock={:.3f} paper={:.3f} scissors={:.3f} -> {}", buckets(kRock),
                     buckets(kPaper), buckets(kScissors),
                     Game::IO::move_to_str(Move(eigen_util::argmax(buckets))));
}

inline std::optional<MarkovEngine::update_result_t> MarkovEngine::reinforce(
  const HistoryState& previous, const HistoryState& observed) {
  ConcreteState next = observed.concrete();
  if (previous.is_empty()) {
    return std::nullopt;
  }

  ConcreteState prev = previous.concrete();
  update_result_t result = weights_.reinforce(prev, next, params_);
  if (result != WeightMatrix::kApplied) {
    LOG_DEBUG("reinforce({} -> {}) refused: {}", Game::IO::state_label(prev),
              Game::IO::state_label(next), magic_enum::enum_name(result));
  }
  return result;
}

}  // namespace rps
