#include "ttt/PlayerFactory.hpp"

#include "ttt/Constants.hpp"
#include "ttt/players/HumanTuiPlayerGenerator.hpp"
#include "ttt/players/PerfectPlayerGenerator.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace ttt {

namespace {

bool answers_to(const AbstractPlayerGenerator& generator, const std::string& type) {
  std::vector<std::string> types = generator.get_types();
  return std::find(types.begin(), types.end(), type) != types.end();
}

std::string joined_types(const AbstractPlayerGenerator& generator) {
  std::string out;
  for (const std::string& type : generator.get_types()) {
    if (!out.empty()) out += '/';
    out += type;
  }
  return out;
}

}  // namespace

PlayerFactory::PlayerFactory(std::vector<generator_maker_t> makers) : makers_(std::move(makers)) {
  std::set<std::string> seen;
  for (const auto& generator : make_all_generators()) {
    for (const std::string& type : generator->get_types()) {
      if (!seen.insert(type).second) {
        throw util::Exception("PlayerFactory: --type={} is claimed by two generators", type);
      }
    }
  }
}

PlayerFactory PlayerFactory::make_default() {
  return PlayerFactory({[] { return generator_ptr_t(new HumanTuiPlayerGenerator()); },
                        [] { return generator_ptr_t(new PerfectPlayerGenerator()); }});
}

PlayerFactory::player_generator_seat_vec_t PlayerFactory::parse(
  const std::vector<std::string>& player_strs) {
  player_generator_seat_vec_t out;
  std::set<std::string> taken_names;

  for (const std::string& player_str : player_strs) {
    std::vector<std::string> tokens = util::split(player_str);
    std::string type = boost_util::pop_option_value(tokens, "type");
    std::string name = boost_util::pop_option_value(tokens, "name");
    std::string seat_str = boost_util::pop_option_value(tokens, "seat");

    CLEAN_ASSERT(!type.empty(), "--player \"{}\" has no --type", player_str);
    generator_ptr_t generator = make_generator(type);
    CLEAN_ASSERT(generator, "--player \"{}\": unknown --type={}", player_str, type);

    PlayerGeneratorSeat entry;
    if (!seat_str.empty()) {
      entry.seat = util::atoi_safe(seat_str);
      CLEAN_ASSERT(entry.seat >= 0 && entry.seat < kNumPlayers,
                   "--player \"{}\": --seat must be 0 or 1", player_str);
    }
    if (!name.empty()) {
      bool fresh = taken_names.insert(name).second;
      CLEAN_ASSERT(fresh, "--name={} is used twice", name);
      generator->set_name(name);
    }
    generator->parse_args(tokens);

    entry.generator = std::move(generator);
    out.push_back(std::move(entry));
  }

  for (PlayerGeneratorSeat& entry : out) {
    AbstractPlayerGenerator& generator = *entry.generator;
    if (!generator.get_name().empty()) continue;

    std::string name = generator.get_default_name();
    for (int suffix = 2; taken_names.count(name); ++suffix) {
      name = generator.get_default_name() + std::to_string(suffix);
    }
    generator.set_name(name);
    taken_names.insert(name);
  }

  return out;
}

void PlayerFactory::print_help(const std::vector<std::string>& player_strs, std::ostream& os) {
  Params params;
  os << params.make_options_description() << std::endl;

  os << "Every other token inside --player \"...\" is an option of the chosen --type. Examples:"
     << std::endl
     << std::endl
     << "  --player \"--type=TUI --seat=0\"" << std::endl
     << "  --player \"--type=Perfect --name=CPU --move-delay-ms=500\"" << std::endl
     << std::endl
     << "Player types:" << std::endl;

  std::vector<generator_ptr_t> generators = make_all_generators();
  for (const auto& generator : generators) {
    os << "  " << joined_types(*generator) << ": " << generator->get_description() << std::endl;
  }

  std::vector<std::string> requested_types;
  for (const std::string& player_str : player_strs) {
    requested_types.push_back(boost_util::get_option_value(util::split(player_str), "type"));
  }

  for (const auto& generator : generators) {
    bool requested = std::any_of(requested_types.begin(), requested_types.end(),
                                 [&](const std::string& t) { return answers_to(*generator, t); });
    if (!requested) continue;

    std::ostringstream ss;
    generator->print_help(ss);
    if (ss.str().empty()) continue;

    os << std::endl << "--type=" << joined_types(*generator) << " options:" << std::endl;
    std::istringstream lines(ss.str());
    for (std::string line; std::getline(lines, line);) {
      os << "  " << line << std::endl;
    }
  }

  if (requested_types.empty()) {
    os << std::endl
       << "Add --player \"--type=<type>\" to -h to list that type's options." << std::endl;
  }
}

PlayerFactory::generator_ptr_t PlayerFactory::make_generator(const std::string& type) const {
  for (const auto& make : makers_) {
    generator_ptr_t generator = make();
    if (answers_to(*generator, type)) return generator;
  }
  return nullptr;
}

std::vector<PlayerFactory::generator_ptr_t> PlayerFactory::make_all_generators() const {
  std::vector<generator_ptr_t> generators;
  for (const auto& make : makers_) {
    generators.push_back(make());
  }
  return generators;
}

}  // namespace ttt
