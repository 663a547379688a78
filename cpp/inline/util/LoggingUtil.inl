#include "util/LoggingUtil.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace util {

inline auto Logging::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Logging options");
  return desc
    .add_option("log-filename", po::value<std::string>(&log_filename),
                "also write the log to this file")
    .add_flag("log-append-mode", "log-write-mode", &append_mode,
              "append to --log-filename instead of truncating it", "truncate --log-filename")
    .add_flag("omit-timestamps", "include-timestamps", &omit_timestamps,
              "log messages without a timestamp prefix", "prefix log messages with a timestamp");
}

}  // namespace util
