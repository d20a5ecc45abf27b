#include "rps/players/CyclePlayer.hpp"

#include "rps/Exceptions.hpp"
#include "rps/Game.hpp"
#include "util/Exception.hpp"

namespace rps {

inline CyclePlayer::CyclePlayer(const std::string& pattern) {
  if (pattern.empty()) {
    throw util::CleanException("Cycle pattern must not be empty");
  }
  for (char c : pattern) {
    try {
      moves_.push_back(Game::IO::parse_move_code(c));
    } catch (const InvalidMoveValue& e) {
      throw util::CleanException("Invalid cycle pattern \"{}\": {}", pattern, e.what());
    }
  }
}

inline Move CyclePlayer::get_move() { return moves_[index_]; }

inline void CyclePlayer::receive_round_result(Move player_move, Move, RoundOutcome) {
  if (player_move != moves_[index_]) {
    throw util::Exception("CyclePlayer: scored move {} but the pattern is at {}",
                          Game::IO::move_to_str(player_move), Game::IO::move_to_str(moves_[index_]));
  }
  index_ = (index_ + 1) % (int)moves_.size();
}

}  // namespace rps
