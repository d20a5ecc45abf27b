#include "util/AnsiCodes.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/EigenUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/Rendering.hpp"
#include "util/StringUtil.hpp"

#include <Eigen/Core>
#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <sstream>
#include <string>
#include <vector>

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    int x = 7;
    RELEASE_ASSERT(x < 5, "x={}", x);
    FAIL() << "expected an exception";
  } catch (const util::Exception& e) {
    std::string what = e.what();
    EXPECT_EQ(what.find("RELEASE_ASSERT(x < 5) failed at "), 0u) << what;
    EXPECT_NE(what.find(": x=7"), std::string::npos) << what;
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_NO_THROW(CLEAN_ASSERT(true, "unused {}", 1));
  EXPECT_THROW(CLEAN_ASSERT(false, "bad value {}", 3), util::CleanException);
  EXPECT_THROW(CLEAN_ASSERT(false), util::CleanAssertionError);
}

TEST(Exception, format) {
  util::Exception e("{} + {} = {}", 1, 2, 3);
  EXPECT_STREQ(e.what(), "1 + 2 = 3");

  util::CleanException ce("plain");
  EXPECT_STREQ(ce.what(), "plain");
}

TEST(Random, uniform_sample) {
  std::mt19937 prng = util::Random::make_prng(1);
  std::array<int, 4> counts = {};
  for (int i = 0; i < 4000; ++i) {
    int k = util::Random::uniform_sample(prng, 2, 6);
    ASSERT_GE(k, 2);
    ASSERT_LT(k, 6);
    counts[k - 2]++;
  }
  for (int c : counts) {
    EXPECT_GT(c, 800);
  }

  EXPECT_EQ(util::Random::uniform_sample(prng, 5, 6), 5);
  EXPECT_THROW(util::Random::uniform_sample(prng, 3, 3), util::Exception);
}

TEST(Random, seeding) {
  std::mt19937 a = util::Random::make_prng(123);
  std::mt19937 b = util::Random::make_prng(123);
  std::mt19937 c = util::Random::make_prng(124);
  std::vector<int> from_a, from_b, from_c;
  for (int i = 0; i < 10; ++i) {
    from_a.push_back(util::Random::uniform_sample(a, 0, 1000));
    from_b.push_back(util::Random::uniform_sample(b, 0, 1000));
    from_c.push_back(util::Random::uniform_sample(c, 0, 1000));
  }
  EXPECT_EQ(from_a, from_b);
  EXPECT_NE(from_a, from_c);
}

TEST(BoostUtil, get_option_value) {
  std::vector<std::string> args = util::split("--type=Cycle --name Bot --pattern=RRP");
  EXPECT_EQ(boost_util::get_option_value(args, "type"), "Cycle");
  EXPECT_EQ(boost_util::get_option_value(args, "name"), "Bot");
  EXPECT_EQ(boost_util::get_option_value(args, "seed"), "");
  EXPECT_EQ(args.size(), 4u);

  EXPECT_EQ(boost_util::pop_option_value(args, "name"), "Bot");
  EXPECT_EQ(boost_util::pop_option_value(args, "type"), "Cycle");
  ASSERT_EQ(args.size(), 1u);
  EXPECT_EQ(args[0], "--pattern=RRP");

  std::vector<std::string> dangling = {"--name"};
  EXPECT_THROW(boost_util::pop_option_value(dangling, "name"), util::CleanException);
}

TEST(BoostUtil, parse_args) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int rounds = 30;
  double rate = 0.5;
  bool flag = false;
  int secret = 0;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"num-rounds", 'n'>(
                        po::value<int>(&rounds)->default_value(rounds), "rounds")
                .template add_option<"rate">(po2::default_value("{:.2f}", &rate), "rate")
                .template add_flag<"flag", "no-flag">(&flag, "set flag", "unset flag")
                .template add_hidden_option<"secret">(po::value<int>(&secret), "hidden");

  po2::parse_args(desc, std::vector<std::string>{"-n", "7", "--rate=0.25", "--flag", "--secret=4"});
  EXPECT_EQ(rounds, 7);
  EXPECT_DOUBLE_EQ(rate, 0.25);
  EXPECT_TRUE(flag);
  EXPECT_EQ(secret, 4);

  po2::parse_args(desc, std::vector<std::string>{"--no-flag"});
  EXPECT_FALSE(flag);

  EXPECT_THROW(po2::parse_args(desc, std::vector<std::string>{"--bogus"}), util::CleanException);
  EXPECT_THROW(po2::parse_args(desc, std::vector<std::string>{"--num-rounds=abc"}),
               util::CleanException);
}

TEST(BoostUtil, help_listing) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  double rate = 0.5;
  bool flag = false;
  int secret = 0;

  po2::options_description raw_desc("Test options");
  po2::options_description other_desc("Other options");
  auto desc = raw_desc.template add_option<"rate", 'r'>(po2::default_value("{:.2f}", &rate), "rate")
                .template add_flag<"flag", "no-flag">(&flag, "set flag", "unset flag")
                .add(other_desc.template add_hidden_option<"secret">(po::value<int>(&secret),
                                                                      "hidden"));

  std::ostringstream brief;
  brief << desc;
  EXPECT_NE(brief.str().find("-r [ --rate ] arg (=0.50)"), std::string::npos) << brief.str();
  EXPECT_NE(brief.str().find("--flag"), std::string::npos);
  EXPECT_EQ(brief.str().find("--no-flag"), std::string::npos);
  EXPECT_EQ(brief.str().find("--secret"), std::string::npos);

  po2::Settings::help_full = true;
  std::ostringstream full;
  full << desc;
  po2::Settings::help_full = false;
  EXPECT_NE(full.str().find("--no-flag"), std::string::npos);
  EXPECT_NE(full.str().find("--secret"), std::string::npos);
}

TEST(StringUtil, split) {
  std::vector<std::string> by_comma = util::split("a,,b", ",");
  ASSERT_EQ(by_comma.size(), 3u);
  EXPECT_EQ(by_comma[0], "a");
  EXPECT_EQ(by_comma[1], "");
  EXPECT_EQ(by_comma[2], "b");

  std::vector<std::string> by_space = util::split(" --type=Cycle \t --pattern=RRP\n");
  ASSERT_EQ(by_space.size(), 2u);
  EXPECT_EQ(by_space[0], "--type=Cycle");
  EXPECT_EQ(by_space[1], "--pattern=RRP");

  EXPECT_EQ(util::split("ab", "::"), std::vector<std::string>{"ab"});
  EXPECT_EQ(util::split("a::", "::"), (std::vector<std::string>{"a", ""}));
  EXPECT_TRUE(util::split("").empty());
  EXPECT_TRUE(util::split(" \t ").empty());
}

TEST(StringUtil, strip) {
  EXPECT_EQ(util::strip("  2 \n"), "2");
  EXPECT_EQ(util::strip("abc"), "abc");
  EXPECT_EQ(util::strip(" \t "), "");
  EXPECT_EQ(util::strip(""), "");
  EXPECT_EQ(util::strip(" a b "), "a b");
}

TEST(eigen_util, argmax) {
  Eigen::Array<double, 3, 1> a;
  a << 0.2, 0.5, 0.3;
  EXPECT_EQ(eigen_util::argmax(a), 1);

  a << 0.4, 0.1, 0.4;
  EXPECT_EQ(eigen_util::argmax(a), 0);

  a << 0.1, 0.4, 0.4;
  EXPECT_EQ(eigen_util::argmax(a), 1);

  a.setConstant(1.0 / 3);
  EXPECT_EQ(eigen_util::argmax(a), 0);
}

TEST(eigen_util, print_matrix) {
  eigen_util::DMatrix<2, 2> m;
  m << 0.5, 0.25, 1.0, 0.0;

  std::ostringstream ss;
  eigen_util::print_matrix(ss, m, {"r0", "r1"}, {"c0", "c1"});
  std::string expected =
    "       c0     c1\n"
    "r0  0.500  0.250\n"
    "r1  1.000  0.000\n";
  EXPECT_EQ(ss.str(), expected);

  EXPECT_THROW(eigen_util::print_matrix(ss, m, {"r0"}, {"c0", "c1"}), util::Exception);
}

TEST(Rendering, set) {
  util::Rendering::Mode base = util::Rendering::mode();

  util::Rendering::set(util::Rendering::kTerminal);
  EXPECT_EQ(util::Rendering::mode(), util::Rendering::kTerminal);
  EXPECT_STREQ(ansi::kRed(), "\033[31m");
  EXPECT_STREQ(ansi::kReset("|"), "\033[00m");

  util::Rendering::set(util::Rendering::kText);
  EXPECT_STREQ(ansi::kRed(), "");
  EXPECT_STREQ(ansi::kReset("|"), "|");

  util::Rendering::set(base);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
