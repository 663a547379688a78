#pragma once

#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace boost_util {

/*
 * Looks up a named option in a tokenized command line, accepting both "--foo=bar" and "--foo bar".
 * Returns the empty string if the option is absent.
 *
 * These are used on the --player "..." strings, where the PlayerFactory needs to peek at a few
 * options before handing the rest to the player type's own parser.
 */
std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name);

// Same as get_option_value(), but erases the option and its value from args.
std::string pop_option_value(std::vector<std::string>& args, const std::string& option_name);

namespace program_options {

/*
 * Builder over boost::program_options::options_description used by every Params struct:
 *
 *   po2::options_description desc("GameServer options");
 *   return desc
 *     .add_option("num-games,G", po::value<int>(&num_games)->default_value(num_games), "...")
 *     .add_flag("print-game-states", "do-not-print-game-states", &print_game_states, "...", "...");
 *
 * Copies share state, so a description returned by value from make_options_description() can
 * still be extended and merged with add(). Reusing a long name or a one-letter abbreviation
 * anywhere in the merged set throws util::Exception.
 */
class options_description {
 public:
  using boost_desc_t = boost::program_options::options_description;

  explicit options_description(const std::string& caption);

  // spec is "name" or "name,c", as in boost.
  options_description& add_option(const std::string& spec,
                                  const boost::program_options::value_semantic* semantic,
                                  const char* help);
  options_description& add_option(const std::string& spec, const char* help);

  /*
   * Registers --on_name and --off_name, which set *flag to true and false respectively. Only the
   * one that changes the current value of *flag is listed in the help output.
   */
  options_description& add_flag(const std::string& on_name, const std::string& off_name,
                                bool* flag, const char* on_help, const char* off_help);

  options_description& add(const options_description& other);

  const boost_desc_t& parser() const { return *parser_; }

  friend std::ostream& operator<<(std::ostream& os, const options_description& desc) {
    return os << *desc.display_;
  }

 private:
  void claim(const std::string& spec);

  std::shared_ptr<boost_desc_t> parser_;   // every option
  std::shared_ptr<boost_desc_t> display_;  // what --help lists
  std::shared_ptr<std::set<std::string>> names_;
};

// Parse errors are rethrown as util::CleanException.
boost::program_options::variables_map parse_args(const options_description& desc, int argc,
                                                 const char* const argv[]);
boost::program_options::variables_map parse_args(const options_description& desc,
                                                 const std::vector<std::string>& args);

}  // namespace program_options

}  // namespace boost_util
