#include "rps/Game.hpp"

#include "rps/Exceptions.hpp"
#include "util/AnsiCodes.hpp"

#include <cctype>
#include <format>

namespace rps {

inline bool Game::Rules::beats(Move a, Move b) {
  validate(a);
  validate(b);
  return (a + 2) % kNumMoves == b;
}

inline Move Game::Rules::counter(Move m) {
  validate(m);
  return Move((m + 1) % kNumMoves);
}

inline RoundOutcome Game::Rules::evaluate(Move player_move, Move computer_move) {
  if (player_move == computer_move) {
    validate(player_move);
    return kTie;
  }
  return beats(player_move, computer_move) ? kWin : kLoss;
}

inline HistoryState Game::Rules::encode(Move player_move, RoundOutcome outcome) {
  validate(player_move);
  validate(outcome);
  return HistoryState(ConcreteState(outcome * kNumMoves + player_move));
}

inline int Game::Rules::score(RoundOutcome outcome) {
  validate(outcome);
  switch (outcome) {
    case kWin:
      return 1;
    case kLoss:
      return -1;
    default:
      return 0;
  }
}

inline std::string Game::IO::move_to_str(Move move) {
  validate(move);
  constexpr const char* kNames[kNumMoves] = {"rock", "paper", "scissors"};
  return kNames[move];
}

inline std::string Game::IO::outcome_message(RoundOutcome outcome) {
  validate(outcome);
  constexpr const char* kMessages[kNumOutcomes] = {"You won!", "You lost!", "It's a tie!"};
  return kMessages[outcome];
}

inline std::string Game::IO::state_label(const HistoryState& state) {
  if (state.is_empty()) return "EM";
  return state_label(state.concrete());
}

inline std::string Game::IO::state_label(ConcreteState state) {
  validate(state);
  constexpr char kOutcomeChars[kNumOutcomes] = {'V', 'L', 'T'};
  constexpr char kMoveChars[kNumMoves] = {'R', 'P', 'S'};
  std::string label;
  label += kOutcomeChars[state / kNumMoves];
  label += kMoveChars[state % kNumMoves];
  return label;
}

inline Move Game::IO::parse_move_code(char c) {
  switch (std::toupper(static_cast<unsigned char>(c))) {
    case 'R':
      return kRock;
    case 'P':
      return kPaper;
    case 'S':
      return kScissors;
    default:
      throw InvalidMoveValue("Invalid move code: '{}'", c);
  }
}

inline void Game::IO::print_round_header(std::ostream& os, int round, int score) {
  os << std::format("-----Round: {} Score: {}-----", round, score) << std::endl;
}

inline void Game::IO::print_moves(std::ostream& os, Move player_move, Move computer_move) {
  os << std::format("You: {} vs Computer: {}", move_to_str(player_move),
                    move_to_str(computer_move))
     << std::endl;
}

inline void Game::IO::print_outcome(std::ostream& os, RoundOutcome outcome) {
  const char* color = "";
  if (outcome == kWin) {
    color = ansi::kGreen();
  } else if (outcome == kLoss) {
    color = ansi::kRed();
  } else {
    color = ansi::kYellow();
  }
  os << color << outcome_message(outcome) << ansi::kReset() << std::endl;
}

}  // namespace rps
