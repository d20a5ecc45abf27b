#pragma once

#include "rps/Types.hpp"

#include <string>

namespace rps {

/*
 * Base class for whoever sits in the human seat of a Match: a person at the terminal, or an
 * automated stand-in.
 *
 * get_move() is called once per round, before the computer's move is revealed.
 * receive_round_result() is called after the round has been scored, with both moves and the
 * outcome from this player's perspective. Scripted players use it to step through their script;
 * a player that adapts to the computer would learn from it.
 */
class AbstractPlayer {
 public:
  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }

  virtual Move get_move() = 0;
  virtual void receive_round_result(Move player_move, Move computer_move, RoundOutcome outcome) {}

 private:
  std::string name_;
};

}  // namespace rps
