#pragma once

#include "rps/Constants.hpp"
#include "rps/Types.hpp"

#include <ostream>
#include <string>

namespace rps {

struct Game {
  /*
   * The beats-relation and the bookkeeping of a single round. All functions are pure and validate
   * their inputs, throwing InvalidMoveValue / InvalidOutcomeValue on out-of-domain values.
   */
  struct Rules {
    // True iff a defeats b: 0 beats 2, 1 beats 0, 2 beats 1.
    static bool beats(Move a, Move b);

    // The unique move that defeats m.
    static Move counter(Move m);

    // Outcome of the round from the player's perspective.
    static RoundOutcome evaluate(Move player_move, Move computer_move);

    // (outcome, move) -> concrete state. Never produces Empty.
    static HistoryState encode(Move player_move, RoundOutcome outcome);

    // Score contribution for the player: +1 / -1 / 0.
    static int score(RoundOutcome outcome);
  };

  struct IO {
    static std::string move_to_str(Move move);                  // "rock"
    static std::string outcome_message(RoundOutcome outcome);   // "You won!"
    static std::string state_label(const HistoryState& state);  // "VR", or "EM" if empty
    static std::string state_label(ConcreteState state);

    /*
     * Parses a single move code: R/P/S (case-insensitive). Throws InvalidMoveValue on anything
     * else.
     */
    static Move parse_move_code(char c);

    static void print_round_header(std::ostream& os, int round, int score);
    static void print_moves(std::ostream& os, Move player_move, Move computer_move);
    static void print_outcome(std::ostream& os, RoundOutcome outcome);
  };
};

}  // namespace rps

#include "inline/rps/Game.inl"
