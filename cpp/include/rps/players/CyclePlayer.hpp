#pragma once

#include "rps/Types.hpp"
#include "rps/players/AbstractPlayer.hpp"

#include <string>
#include <vector>

namespace rps {

/*
 * Repeats a fixed sequence of moves forever, written as move codes: "RRP" plays rock, rock, paper,
 * rock, rock, paper, ...
 *
 * The position in the pattern advances when a round is scored, so asking for the move again
 * before receive_round_result() returns the same move.
 *
 * The constructor throws util::CleanException if the pattern is empty or contains anything but
 * R/P/S (case-insensitive).
 */
class CyclePlayer : public AbstractPlayer {
 public:
  explicit CyclePlayer(const std::string& pattern);

  Move get_move() override;
  void receive_round_result(Move player_move, Move computer_move, RoundOutcome outcome) override;

  const std::vector<Move>& moves() const { return moves_; }

 private:
  std::vector<Move> moves_;
  int index_ = 0;
};

}  // namespace rps

#include "inline/rps/players/CyclePlayer.inl"
