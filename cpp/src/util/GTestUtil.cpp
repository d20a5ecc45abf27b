#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Rendering.hpp"

#include <boost/program_options.hpp>

#include <cstring>
#include <iostream>

/*
 * gtest exits from InitGoogleTest() when it sees --help, and our parser would reject gtest's own
 * --gtest_* flags. So: print our options first if help was asked for, let gtest consume its flags
 * (and print its help and exit), then parse what remains.
 */
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description());

  bool help = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help-full") == 0) {
      po2::Settings::help_full = true;
      argv[i] = const_cast<char*>("--help");  // gtest only knows --help
    }
    help |= std::strcmp(argv[i], "--help") == 0;
  }
  if (help) {
    std::cout << desc << std::endl;
  }

  testing::InitGoogleTest(&argc, argv);
  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);

  // Tests compare printed output, which must not contain color codes.
  util::Rendering::set(util::Rendering::kText);
  return RUN_ALL_TESTS();
}
