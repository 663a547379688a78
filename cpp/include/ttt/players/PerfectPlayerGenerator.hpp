#pragma once

#include "ttt/AbstractPlayerGenerator.hpp"
#include "ttt/players/PerfectPlayer.hpp"
#include "util/BoostUtil.hpp"

#include <string>
#include <vector>

namespace ttt {

class PerfectPlayerGenerator : public AbstractPlayerGenerator {
 public:
  std::string get_default_name() const override { return "Perfect"; }
  std::vector<std::string> get_types() const override { return {"Perfect", "Minimax"}; }
  std::string get_description() const override { return "Perfect player (full minimax)"; }
  AbstractPlayer* generate() override { return new PerfectPlayer(params_); }
  void print_help(std::ostream& s) override { s << params_.make_options_description(); }
  void parse_args(const std::vector<std::string>& args) override {
    namespace po2 = boost_util::program_options;
    po2::parse_args(params_.make_options_description(), args);
  }

 private:
  PerfectPlayer::Params params_;
};

}  // namespace ttt
