#pragma once

#include "rps/players/AbstractPlayer.hpp"
#include "util/BoostUtil.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rps {

/*
 * An AbstractPlayerGenerator creates AbstractPlayer instances via its generate() method.
 *
 * The command line selects a generator with:
 *
 * --player "--type=Cycle --pattern=RRP"
 *
 * Each subclass specifies which --type= strings it matches, and how to parse the remaining
 * sub-arguments in order to construct a player object.
 */
class AbstractPlayerGenerator {
 public:
  virtual ~AbstractPlayerGenerator() = default;

  virtual std::string get_default_name() const = 0;

  /*
   * Returns a list of strings that match against the --type argument. Multiple entries act as
   * aliases.
   */
  virtual std::vector<std::string> get_types() const = 0;

  // A short description of the player type, used in help messages.
  virtual std::string get_description() const = 0;

  // Generate a new player. The caller is responsible for taking ownership of the pointer.
  virtual AbstractPlayer* generate() = 0;

  /*
   * Print help for this player generator, describing what parse_args() expects. If there are no
   * associated options for this player type, then this method does not need to be overriden.
   */
  virtual void print_help(std::ostream& s) {}

  /*
   * Takes the tokens of a --player argument, with --type and --name already removed, and parses
   * them. This is called before generate().
   */
  virtual void parse_args(const std::vector<std::string>& args) {}

  const std::string& get_name() const { return name_; }

  /*
   * Validates name, raising an exception if the name is invalid (too long or uses invalid
   * characters). An empty name selects get_default_name().
   */
  void set_name(const std::string& name);

  // Convenience method that composes generate() with set_name().
  AbstractPlayer* generate_with_name();

 protected:
  template <typename T>
  void parse_args_helper(T&& desc, const std::vector<std::string>& args) {
    namespace po2 = boost_util::program_options;
    po2::parse_args(desc, args);
  }

 private:
  std::string name_;
};

}  // namespace rps

#include "inline/rps/players/AbstractPlayerGenerator.inl"
