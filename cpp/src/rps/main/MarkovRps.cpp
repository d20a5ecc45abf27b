#include "rps/Game.hpp"
#include "rps/Match.hpp"
#include "rps/MarkovEngine.hpp"
#include "rps/PlayerFactory.hpp"
#include "rps/players/AbstractPlayer.hpp"
#include "rps/players/AbstractPlayerGenerator.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>

struct Args {
  std::string player_str = rps::PlayerFactory::kDefaultPlayerStr;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc.template add_option<"player">(
      po::value<std::string>(&player_str)->default_value(player_str),
      "space-delimited player options, wrapped in quotes, selecting who plays against the "
      "computer");
  }
};

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    rps::Match::Params match_params;
    rps::MarkovEngine::Params engine_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(match_params.make_options_description())
                  .add(engine_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    rps::PlayerFactory player_factory;
    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      player_factory.print_help(std::cout, {args.player_str});
      return 0;
    }

    util::Logging::init(log_params);

    LOG_INFO("Starting markov_rps: player=\"{}\" decrease-value={} increase-value={} "
             "num-rounds={} score-limit={} seed={}",
             args.player_str, engine_params.decrease_value, engine_params.increase_value,
             match_params.num_rounds, match_params.score_limit, random_params.seed);

    std::unique_ptr<rps::AbstractPlayerGenerator> generator(player_factory.parse(args.player_str));
    std::unique_ptr<rps::AbstractPlayer> player(generator->generate_with_name());

    rps::Match match(match_params, engine_params, *player, random_params.seed);
    rps::Match::print_banner(std::cout, match_params);
    match.run();
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
