#pragma once

#include "rps/players/AbstractPlayerGenerator.hpp"
#include "rps/players/CyclePlayer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rps {

class CyclePlayerGenerator : public AbstractPlayerGenerator {
 public:
  struct Params {
    auto make_options_description();

    std::string pattern = "RPS";
  };

  std::string get_default_name() const override { return "Cycle"; }
  std::vector<std::string> get_types() const override { return {"Cycle"}; }
  std::string get_description() const override { return "Repeats a fixed pattern of moves"; }
  AbstractPlayer* generate() override { return new CyclePlayer(params_.pattern); }
  void print_help(std::ostream& s) override;
  void parse_args(const std::vector<std::string>& args) override;

 private:
  Params params_;
};

}  // namespace rps

#include "inline/rps/players/CyclePlayerGenerator.inl"
