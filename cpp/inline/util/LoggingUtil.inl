#include "util/LoggingUtil.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace util {

inline auto Logging::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Logging options");
  return desc
    .template add_option<"log-filename">(po::value<std::string>(&log_filename),
                                         "copy the match log to this file")
    .template add_flag<"log-append-mode", "log-write-mode">(
      &append_mode, "keep the existing contents of --log-filename",
      "truncate --log-filename first")
    .template add_flag<"omit-timestamps", "include-timestamps">(
      &omit_timestamps, "print bare log messages", "prefix each log message with the time");
}

}  // namespace util
