#include "rps/players/AbstractPlayerGenerator.hpp"

#include "rps/Constants.hpp"
#include "util/Exception.hpp"

#include <cctype>

namespace rps {

inline void AbstractPlayerGenerator::set_name(const std::string& name) {
  if (name.empty()) {
    name_ = get_default_name();
    return;
  }

  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      throw util::CleanException("Invalid character in player name (\"{}\")", name);
    }
  }

  int name_size = name.size();
  if (name_size > kMaxNameLength) {
    throw util::CleanException("Player name (\"{}\") too long ({} > {})", name, name_size,
                               kMaxNameLength);
  }

  name_ = name;
}

inline AbstractPlayer* AbstractPlayerGenerator::generate_with_name() {
  auto player = generate();
  player->set_name(name_);
  return player;
}

}  // namespace rps
