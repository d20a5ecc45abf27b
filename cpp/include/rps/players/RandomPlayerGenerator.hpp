#pragma once

#include "rps/players/AbstractPlayerGenerator.hpp"
#include "rps/players/RandomPlayer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rps {

class RandomPlayerGenerator : public AbstractPlayerGenerator {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  std::string get_default_name() const override { return "Random"; }
  std::vector<std::string> get_types() const override { return {"Random"}; }
  std::string get_description() const override { return "Random player"; }
  AbstractPlayer* generate() override { return new RandomPlayer(params_.seed); }
  void print_help(std::ostream& s) override;
  void parse_args(const std::vector<std::string>& args) override;

 private:
  Params params_;
};

}  // namespace rps

#include "inline/rps/players/RandomPlayerGenerator.inl"
