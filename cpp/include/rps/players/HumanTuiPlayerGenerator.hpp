#pragma once

#include "rps/players/AbstractPlayerGenerator.hpp"
#include "rps/players/HumanTuiPlayer.hpp"

#include <string>
#include <vector>

namespace rps {

class HumanTuiPlayerGenerator : public AbstractPlayerGenerator {
 public:
  std::string get_default_name() const override { return "Human"; }
  std::vector<std::string> get_types() const override { return {"TUI"}; }
  std::string get_description() const override { return "Human player, prompted on stdin"; }
  AbstractPlayer* generate() override { return new HumanTuiPlayer(); }
};

}  // namespace rps
