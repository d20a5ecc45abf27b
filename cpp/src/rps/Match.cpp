#include "rps/Match.hpp"

#include "rps/Game.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <format>

namespace rps {

void Match::Params::validate() const {
  if (num_rounds <= 0) {
    throw util::CleanException("num-rounds must be positive (got {})", num_rounds);
  }
  if (score_limit <= 0) {
    throw util::CleanException("score-limit must be positive (got {})", score_limit);
  }
}

Match::Match(const Params& params, const MarkovEngine::Params& engine_params,
             AbstractPlayer& player, int seed, std::ostream& os)
    : params_(params),
      engine_(engine_params),
      player_(player),
      os_(os),
      prng_(util::Random::make_prng(seed)) {
  params_.validate();
}

void Match::print_banner(std::ostream& os, const Params& params) {
  os << "Welcome to classic \"ROCK-PAPER-SCISSORS\" game" << std::endl;
  os << std::format("You are going to play {} rounds vs computer", params.num_rounds) << std::endl;
  os << "Score is now set to 0. Win: +1, Loss: -1, Tie: 0" << std::endl;
  os << std::format("If score hits {} - you win, if -{} - you lose", params.score_limit,
                    params.score_limit)
     << std::endl;
}

MatchResult Match::run() {
  while (!finished()) {
    play_round();
  }

  if (result_.score > 0) {
    result_.verdict = MatchResult::kPlayerWon;
  } else if (result_.score < 0) {
    result_.verdict = MatchResult::kComputerWon;
  } else {
    result_.verdict = MatchResult::kTied;
  }

  print_game_over();
  if (params_.print_matrix) {
    engine_.weights().print(os_);
  }

  LOG_INFO("Match over after {} rounds: score={} wins={} losses={} ties={}", result_.rounds,
           result_.score, result_.wins, result_.losses, result_.ties);
  return result_;
}

void Match::play_round() {
  Game::IO::print_round_header(os_, result_.rounds, result_.score);

  Move player_move = player_.get_move();
  Move computer_move = engine_.decide(previous_, prng_);

  if (params_.verbose && !previous_.is_empty()) {
    os_ << std::format("Prediction from {}: {}", Game::IO::state_label(previous_),
                       engine_.describe_prediction(previous_))
        << std::endl;
  }

  Game::IO::print_moves(os_, player_move, computer_move);
  RoundOutcome outcome = Game::Rules::evaluate(player_move, computer_move);
  Game::IO::print_outcome(os_, outcome);

  HistoryState state = Game::Rules::encode(player_move, outcome);

  LOG_DEBUG("round={} previous={} prediction=[{}] player={} computer={} outcome={} state={}",
            result_.rounds, Game::IO::state_label(previous_),
            engine_.describe_prediction(previous_), Game::IO::move_to_str(player_move),
            Game::IO::move_to_str(computer_move), Game::IO::outcome_message(outcome),
            Game::IO::state_label(state));

  engine_.reinforce(previous_, state);

  if (params_.verbose && !previous_.is_empty()) {
    os_ << std::format("Row {} after update:", Game::IO::state_label(previous_)) << std::endl;
    os_ << engine_.weights().row(previous_.concrete()) << std::endl;
  }

  player_.receive_round_result(player_move, computer_move, outcome);

  previous_ = state;
  result_.score += Game::Rules::score(outcome);
  result_.rounds++;
  switch (outcome) {
    case kWin:
      result_.wins++;
      break;
    case kLoss:
      result_.losses++;
      break;
    default:
      result_.ties++;
      break;
  }
}

bool Match::finished() const {
  return result_.rounds >= params_.num_rounds || result_.score >= params_.score_limit ||
         result_.score <= -params_.score_limit;
}

void Match::print_game_over() const {
  os_ << "-----GAME OVER!-----" << std::endl;
  switch (result_.verdict) {
    case MatchResult::kPlayerWon:
      os_ << "You won! Congratulations" << std::endl;
      break;
    case MatchResult::kComputerWon:
      os_ << "You lost! Better luck next time!" << std::endl;
      break;
    default:
      os_ << "It's a tie!" << std::endl;
      break;
  }
}

}  // namespace rps
