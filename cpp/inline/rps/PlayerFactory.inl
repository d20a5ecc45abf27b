#include "rps/PlayerFactory.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace rps {

inline auto PlayerFactory::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("PlayerFactory options, for --player \"...\"");
  return desc.template add_option<"type">(po::value<std::string>(&type), "required")
    .template add_option<"name">(po::value<std::string>(&name),
                                 "if unspecified, then a default name is chosen");
}

}  // namespace rps
