#pragma once

#include "rps/players/AbstractPlayer.hpp"
#include "rps/players/AbstractPlayerGenerator.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rps {

class PlayerSubfactoryBase {
 public:
  virtual ~PlayerSubfactoryBase() = default;
  virtual AbstractPlayerGenerator* create() = 0;
};

/*
 * PlayerSubfactory is a helper class used by PlayerFactory. Each PlayerSubfactory is associated
 * with a particular player type.
 */
template <typename GeneratorT>
class PlayerSubfactory : public PlayerSubfactoryBase {
 public:
  GeneratorT* create() override { return new GeneratorT(); }
};

/*
 * Builds the player of the human seat from a --player argument:
 *
 * --player "--type=TUI"
 * --player "--type=Random --seed=7"
 * --player "--type=Cycle --name=Bot --pattern=RRP"
 *
 * --type selects the generator; --name is optional; all remaining tokens are parsed by the selected
 * generator.
 */
class PlayerFactory {
 public:
  using player_subfactory_vec_t = std::vector<PlayerSubfactoryBase*>;

  static constexpr const char* kDefaultPlayerStr = "--type=TUI";

  struct Params {
    auto make_options_description();

    std::string type;
    std::string name;
  };

  // Takes ownership of the subfactories. Throws util::Exception if two generators share a type.
  PlayerFactory(const player_subfactory_vec_t& subfactories);

  // The TUI, Random and Cycle generators.
  PlayerFactory();

  ~PlayerFactory();
  PlayerFactory(const PlayerFactory&) = delete;
  PlayerFactory& operator=(const PlayerFactory&) = delete;

  /*
   * Returns the generator matching player_str, with its name set and its sub-arguments parsed. The
   * caller is responsible for taking ownership of the pointer.
   *
   * Throws util::CleanException if --type is missing or unknown, or if the sub-arguments do not
   * parse.
   */
  AbstractPlayerGenerator* parse(const std::string& player_str);

  void print_help(std::ostream& os, const std::vector<std::string>& player_strs);

 private:
  static std::string type_str(const AbstractPlayerGenerator* generator);
  static bool matches(const AbstractPlayerGenerator* generator, const std::string& type);

  player_subfactory_vec_t subfactories_;
};

}  // namespace rps

#include "inline/rps/PlayerFactory.inl"
