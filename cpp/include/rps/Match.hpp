#pragma once

#include "rps/Constants.hpp"
#include "rps/MarkovEngine.hpp"
#include "rps/Types.hpp"
#include "rps/players/AbstractPlayer.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <string>

namespace rps {

struct MatchResult {
  enum verdict_t : int8_t { kPlayerWon, kComputerWon, kTied };

  int rounds = 0;
  int score = 0;  // from the player's perspective
  int wins = 0;
  int losses = 0;
  int ties = 0;
  verdict_t verdict = kTied;
};

/*
 * Plays a match between an AbstractPlayer (the human seat) and a MarkovEngine.
 *
 * Each round: the player picks a move, the engine decides its move from the previous history state,
 * the round is scored, and the engine is reinforced with the (previous -> new) transition before
 * the new state becomes the previous one.
 *
 * The match continues while round < num_rounds and -score_limit < score < score_limit.
 *
 * The Match owns the engine and its own prng. It does not own the player.
 */
class Match {
 public:
  struct Params {
    auto make_options_description();

    // Throws util::CleanException unless num_rounds and score_limit are positive.
    void validate() const;

    int num_rounds = kDefaultNumRounds;
    int score_limit = kDefaultScoreLimit;
    bool verbose = false;
    bool print_matrix = false;
  };

  Match(const Params& params, const MarkovEngine::Params& engine_params, AbstractPlayer& player,
        int seed, std::ostream& os = std::cout);

  static void print_banner(std::ostream& os, const Params& params);

  // Plays rounds until finished(), prints the final verdict, and returns the tally.
  MatchResult run();

  void play_round();
  bool finished() const;

  const MatchResult& result() const { return result_; }
  const HistoryState& previous() const { return previous_; }
  const MarkovEngine& engine() const { return engine_; }

 private:
  void print_game_over() const;

  const Params params_;
  MarkovEngine engine_;
  AbstractPlayer& player_;
  std::ostream& os_;
  std::mt19937 prng_;

  HistoryState previous_ = HistoryState::empty();
  MatchResult result_;
};

}  // namespace rps

#include "inline/rps/Match.inl"
