#include "ttt/PlayerFactory.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace ttt {

inline auto PlayerFactory::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Inside each --player \"...\"");
  return desc.add_option("type", po::value<std::string>(&type), "player type (required)")
    .add_option("name", po::value<std::string>(&name), "display name; defaults to the type's name")
    .add_option("seat", po::value<int>(&seat),
                "0 plays X and moves first, 1 plays O; defaults to the lowest free seat");
}

}  // namespace ttt
