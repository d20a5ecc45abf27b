#include "rps/PlayerFactory.hpp"

#include "rps/players/CyclePlayerGenerator.hpp"
#include "rps/players/HumanTuiPlayerGenerator.hpp"
#include "rps/players/RandomPlayerGenerator.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <memory>
#include <set>
#include <sstream>

namespace rps {

PlayerFactory::PlayerFactory(const player_subfactory_vec_t& subfactories)
    : subfactories_(subfactories) {
  // validate that the generator types don't overlap
  std::set<std::string> types;
  for (auto* subfactory : subfactories_) {
    std::unique_ptr<AbstractPlayerGenerator> generator(subfactory->create());
    for (const auto& type : generator->get_types()) {
      if (types.count(type)) {
        throw util::Exception("PlayerFactory: duplicate type: {}", type);
      }
      types.insert(type);
    }
  }
}

PlayerFactory::PlayerFactory()
    : PlayerFactory({new PlayerSubfactory<HumanTuiPlayerGenerator>(),
                     new PlayerSubfactory<RandomPlayerGenerator>(),
                     new PlayerSubfactory<CyclePlayerGenerator>()}) {}

PlayerFactory::~PlayerFactory() {
  for (auto* subfactory : subfactories_) {
    delete subfactory;
  }
}

AbstractPlayerGenerator* PlayerFactory::parse(const std::string& player_str) {
  std::vector<std::string> tokens = util::split(player_str);

  std::string type = boost_util::pop_option_value(tokens, "type");
  std::string name = boost_util::pop_option_value(tokens, "name");

  CLEAN_ASSERT(!type.empty(), "Must specify --type in --player \"{}\"", player_str);

  std::unique_ptr<AbstractPlayerGenerator> matched_generator;
  for (auto* subfactory : subfactories_) {
    std::unique_ptr<AbstractPlayerGenerator> generator(subfactory->create());
    if (matches(generator.get(), type)) {
      CLEAN_ASSERT(matched_generator == nullptr, "Type {}: multiple matches", type);
      matched_generator = std::move(generator);
    }
  }

  CLEAN_ASSERT(matched_generator != nullptr, "Unknown type in --player \"{}\"", player_str);

  matched_generator->set_name(name);
  matched_generator->parse_args(tokens);
  return matched_generator.release();
}

void PlayerFactory::print_help(std::ostream& os, const std::vector<std::string>& player_strs) {
  Params params;
  os << params.make_options_description();
  os << "  --... ...             type-specific args, dependent on --type" << std::endl
     << std::endl;

  os << "To choose who plays against the computer, pass something like:" << std::endl
     << std::endl;
  os << "  --player \"--type=Cycle --name=Bot <type-specific options...>\"" << std::endl
     << std::endl;

  os << "The set of legal --type values are:" << std::endl;

  std::vector<std::unique_ptr<AbstractPlayerGenerator>> generators;
  for (auto* subfactory : subfactories_) {
    generators.emplace_back(subfactory->create());
  }
  for (const auto& generator : generators) {
    os << "  " << type_str(generator.get()) << ": " << generator->get_description() << std::endl;
  }
  os << std::endl;
  os << "To see the options for a specific --type, pass -h --player \"--type=<type>\""
     << std::endl;

  std::vector<bool> used_types(generators.size(), false);
  for (const std::string& s : player_strs) {
    std::vector<std::string> tokens = util::split(s);
    std::string type = boost_util::get_option_value(tokens, "type");
    for (int g = 0; g < (int)generators.size(); ++g) {
      if (matches(generators[g].get(), type)) {
        used_types[g] = true;
        break;
      }
    }
  }

  for (int g = 0; g < (int)generators.size(); ++g) {
    if (!used_types[g]) continue;

    AbstractPlayerGenerator* generator = generators[g].get();

    std::ostringstream ss;
    generator->print_help(ss);
    std::string s = ss.str();
    if (!s.empty()) {
      os << std::endl << "--type=" << type_str(generator) << " options:" << std::endl << std::endl;

      std::stringstream ss2(s);
      std::string line;
      while (std::getline(ss2, line, '\n')) {
        os << "  " << line << std::endl;
      }
    }
  }
}

std::string PlayerFactory::type_str(const AbstractPlayerGenerator* generator) {
  std::vector<std::string> types = generator->get_types();
  std::ostringstream ss;
  for (int k = 0; k < (int)types.size(); ++k) {
    if (k > 0) {
      ss << "/";
    }
    ss << types[k];
  }
  return ss.str();
}

bool PlayerFactory::matches(const AbstractPlayerGenerator* generator, const std::string& type) {
  for (const auto& t : generator->get_types()) {
    if (t == type) {
      return true;
    }
  }
  return false;
}

}  // namespace rps
