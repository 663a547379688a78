#include "ttt/DecisionEngine.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace ttt {

inline auto DecisionEngine::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("DecisionEngine options (with --analyze-board)");
  return desc.add_option("verbose,v", po::bool_switch(&verbose)->default_value(verbose),
                         "log per-move minimax scores");
}

}  // namespace ttt
