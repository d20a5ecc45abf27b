#include "rps/players/RandomPlayerGenerator.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace rps {

inline auto RandomPlayerGenerator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("rps::RandomPlayerGenerator options");
  return desc.template add_option<"seed", 's'>(
    po::value<int>(&seed)->default_value(seed),
    "seed of the player's own prng (default: 0 means seed with current time)");
}

inline void RandomPlayerGenerator::print_help(std::ostream& s) {
  s << params_.make_options_description();
}

inline void RandomPlayerGenerator::parse_args(const std::vector<std::string>& args) {
  this->parse_args_helper(params_.make_options_description(), args);
}

}  // namespace rps
