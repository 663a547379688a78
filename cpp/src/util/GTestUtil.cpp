#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  log_params.omit_timestamps = true;
  po2::options_description desc = log_params.make_options_description();

  // Strips the --gtest_* flags from argv. With --help it prints gtest's usage and leaves the flag
  // in place for us.
  testing::InitGoogleTest(&argc, argv);
  std::vector<std::string> args(argv + 1, argv + argc);

  bool help = std::any_of(args.begin(), args.end(),
                          [](const std::string& arg) { return arg == "--help" || arg == "-h"; });
  if (help) {
    std::cout << desc << std::endl;
    return 0;
  }

  po2::parse_args(desc, args);
  util::Logging::init(log_params);
  return RUN_ALL_TESTS();
}
