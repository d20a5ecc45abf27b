#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <optional>

namespace boost_util {

namespace {

struct located_option_t {
  size_t index;       // position of the token that names the option
  size_t num_tokens;  // 1 for "--name=value", 2 for "--name value", 0 if the value is missing
  std::string value;
};

std::optional<located_option_t> locate(const std::vector<std::string>& args,
                                       const std::string& option_name) {
  const std::string flag = "--" + option_name;
  const std::string prefix = flag + "=";

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i].starts_with(prefix)) {
      return located_option_t{i, 1, args[i].substr(prefix.size())};
    }
    if (args[i] == flag) {
      if (i + 1 == args.size()) {
        return located_option_t{i, 0, ""};
      }
      return located_option_t{i, 2, args[i + 1]};
    }
  }
  return std::nullopt;
}

}  // namespace

std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name) {
  std::optional<located_option_t> loc = locate(args, option_name);
  return loc ? loc->value : "";
}

std::string pop_option_value(std::vector<std::string>& args, const std::string& option_name) {
  std::optional<located_option_t> loc = locate(args, option_name);
  if (!loc) {
    return "";
  }
  if (loc->num_tokens == 0) {
    throw util::CleanException("Missing value for option '{}'", option_name);
  }

  auto first = args.begin() + loc->index;
  args.erase(first, first + loc->num_tokens);
  return loc->value;
}

}  // namespace boost_util
