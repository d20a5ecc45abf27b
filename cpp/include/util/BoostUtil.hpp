#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>
#include <boost/shared_ptr.hpp>

#include <format>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace boost_util {

/*
 * Reads --name from a tokenized --player string, in either the "--name=value" or the
 * "--name value" form:
 *
 * get_option_value(util::split("--type=Cycle --pattern RRP"), "pattern") -> "RRP"
 *
 * Returns "" if the option is absent or has no value.
 */
std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name);

/*
 * Like get_option_value(), but erases the option's tokens from args. A trailing --name with no
 * value is a util::CleanException.
 */
std::string pop_option_value(std::vector<std::string>& args, const std::string& option_name);

namespace program_options {

namespace po = boost::program_options;

/*
 * po::value<double>(&x)->default_value(x) shows x at full precision in --help. This shows the
 * default through a format string instead:
 *
 * default_value("{:.3f}", &decrease_value)  // [=0.010]
 */
template <typename T>
auto default_value(std::format_string<T> fmt, T* dest) {
  return po::value<T>(dest)->default_value(*dest, std::format(fmt, T(*dest)));
}

namespace detail {

struct option_tables_t {
  explicit option_tables_t(const char* caption);

  po::options_description all;
  po::options_description listed;
};

}  // namespace detail

struct Settings {
  // Set when --help-full is requested. Hidden options are printed only then.
  static inline bool help_full = false;
};

/*
 * Builder over a pair of boost options_descriptions: one with every option (used for parsing and
 * --help-full) and one without the hidden options (used for --help).
 *
 * Each add_*() returns a new builder whose type records the option names and abbreviations added
 * so far, so a name or abbreviation defined twice is a compile error:
 *
 * po2::options_description desc("Match options");
 * return desc.add_option<"num-rounds", 'n'>(po::value<int>(&num_rounds), "...")
 *            .add_option<"score-limit", 'l'>(po::value<int>(&score_limit), "...");
 *
 * Builders returned by add_*() share their tables with the builder they came from.
 */
template <typename Names = util::NameList<>, typename Abbrevs = util::CharList<>>
class options_description {
 public:
  explicit options_description(const char* caption);

  // A switch that takes no value, like --help.
  template <util::StringLiteral Name, char Abbrev = ' '>
  auto add_option(const char* help);

  template <util::StringLiteral Name, char Abbrev = ' '>
  auto add_option(const po::value_semantic* semantic, const char* help);

  // Listed by --help-full only.
  template <util::StringLiteral Name>
  auto add_hidden_option(const po::value_semantic* semantic, const char* help);

  // --Name sets *flag and --Negation clears it. --help lists only the one that is not a no-op.
  template <util::StringLiteral Name, util::StringLiteral Negation>
  auto add_flag(bool* flag, const char* help, const char* negation_help);

  template <typename Names2, typename Abbrevs2>
  auto add(const options_description<Names2, Abbrevs2>& other);

  const po::options_description& all() const { return tables_->all; }

  friend std::ostream& operator<<(std::ostream& os, const options_description& desc) {
    return os << (Settings::help_full ? desc.tables_->all : desc.tables_->listed);
  }

 private:
  template <typename, typename>
  friend class options_description;

  using tables_ptr_t = std::shared_ptr<detail::option_tables_t>;

  explicit options_description(tables_ptr_t tables) : tables_(std::move(tables)) {}

  template <util::StringLiteral Name, char Abbrev>
  auto extended() const;

  template <util::StringLiteral Name, char Abbrev>
  auto insert(boost::shared_ptr<po::option_description> option, bool hidden);

  tables_ptr_t tables_;
};

/*
 * Parses argc/argv, or a std::vector<std::string> of tokens, against desc and runs notify(). boost
 * parse errors come back as util::CleanException.
 */
template <typename Names, typename Abbrevs, typename... Args>
po::variables_map parse_args(const options_description<Names, Abbrevs>& desc, Args&&... args);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
