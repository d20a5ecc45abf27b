#pragma once

#include "rps/Types.hpp"
#include "rps/players/AbstractPlayer.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace rps {

/*
 * Prompts for a move on a text terminal.
 *
 * Valid replies are 1, 2 and 3 (surrounding whitespace ignored), for rock, paper and scissors.
 * Anything else gets a "Wrong choice!" and a fresh prompt. If the input stream ends, get_move()
 * throws util::CleanException, so that the match stops cleanly.
 */
class HumanTuiPlayer : public AbstractPlayer {
 public:
  static constexpr const char* kPrompt = "Choose your move: 1-rock 2-paper 3-scissors: ";
  static constexpr const char* kComplaint = "Wrong choice!";

  HumanTuiPlayer(std::istream& in = std::cin, std::ostream& out = std::cout)
      : in_(in), out_(out) {}

  Move get_move() override;

  // Returns std::nullopt if s is not a valid reply.
  static std::optional<Move> parse_reply(const std::string& s);

 private:
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace rps
