#include "rps/players/CyclePlayerGenerator.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace rps {

inline auto CyclePlayerGenerator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("rps::CyclePlayerGenerator options");
  return desc.template add_option<"pattern", 'p'>(
    po::value<std::string>(&pattern)->default_value(pattern),
    "moves to repeat, as a string of R/P/S codes (e.g. RRP)");
}

inline void CyclePlayerGenerator::print_help(std::ostream& s) {
  s << params_.make_options_description();
}

inline void CyclePlayerGenerator::parse_args(const std::vector<std::string>& args) {
  this->parse_args_helper(params_.make_options_description(), args);
}

}  // namespace rps
