#include "rps/players/HumanTuiPlayer.hpp"

#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

namespace rps {

Move HumanTuiPlayer::get_move() {
  while (true) {
    out_ << kPrompt << std::flush;

    std::string input;
    if (!std::getline(in_, input)) {
      throw util::CleanException("stdin closed");
    }

    std::optional<Move> move = parse_reply(input);
    if (move.has_value()) {
      return *move;
    }
    out_ << kComplaint << std::endl;
  }
}

std::optional<Move> HumanTuiPlayer::parse_reply(const std::string& s) {
  std::string reply = util::strip(s);
  if (reply == "1") return kRock;
  if (reply == "2") return kPaper;
  if (reply == "3") return kScissors;
  return std::nullopt;
}

}  // namespace rps
