#include "rps/Match.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace rps {

inline auto Match::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Match options");
  return desc
    .template add_option<"num-rounds", 'n'>(po::value<int>(&num_rounds)->default_value(num_rounds),
                                            "maximum number of rounds")
    .template add_option<"score-limit", 'l'>(
      po::value<int>(&score_limit)->default_value(score_limit),
      "the match ends early once the score reaches +/- this value")
    .template add_option<"verbose", 'v'>(po::bool_switch(&verbose)->default_value(verbose),
                                         "print the prediction and the touched matrix row each round")
    .template add_hidden_option<"print-matrix">(
      po::bool_switch(&print_matrix)->default_value(print_matrix),
      "print the weight matrix when the match ends");
}

}  // namespace rps
