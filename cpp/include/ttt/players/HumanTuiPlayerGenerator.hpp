#pragma once

#include "ttt/AbstractPlayerGenerator.hpp"
#include "ttt/players/HumanTuiPlayer.hpp"

#include <string>
#include <vector>

namespace ttt {

class HumanTuiPlayerGenerator : public AbstractPlayerGenerator {
 public:
  std::string get_default_name() const override { return "Human"; }
  std::vector<std::string> get_types() const override { return {"TUI", "Human"}; }
  std::string get_description() const override { return "Human player"; }
  AbstractPlayer* generate() override { return new HumanTuiPlayer(); }
};

}  // namespace ttt
