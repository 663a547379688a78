#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <memory>

namespace boost_util {

namespace {

struct OptionMatch {
  size_t pos = 0;
  size_t num_tokens = 0;  // 0 if not found
  std::string value;
};

OptionMatch find_option(const std::vector<std::string>& args, const std::string& option_name) {
  const std::string flag = "--" + option_name;
  const std::string prefix = flag + "=";

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i].starts_with(prefix)) {
      return OptionMatch{i, 1, args[i].substr(prefix.size())};
    }
    if (args[i] == flag) {
      if (i + 1 == args.size()) {
        throw util::CleanException("Missing value for option '{}'", option_name);
      }
      return OptionMatch{i, 2, args[i + 1]};
    }
  }
  return OptionMatch{};
}

}  // namespace

std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name) {
  return find_option(args, option_name).value;
}

std::string pop_option_value(std::vector<std::string>& args, const std::string& option_name) {
  OptionMatch match = find_option(args, option_name);
  auto begin = args.begin() + match.pos;
  args.erase(begin, begin + match.num_tokens);
  return match.value;
}

namespace program_options {

namespace po = boost::program_options;

options_description::options_description(const std::string& caption)
    : parser_(std::make_shared<boost_desc_t>(caption, util::get_screen_width() - 1)),
      display_(std::make_shared<boost_desc_t>(caption, util::get_screen_width() - 1)),
      names_(std::make_shared<std::set<std::string>>()) {}

options_description& options_description::add_option(const std::string& spec,
                                                      const po::value_semantic* semantic,
                                                      const char* help) {
  std::unique_ptr<const po::value_semantic> owned(semantic);  // until boost takes it
  claim(spec);
  parser_->add_options()(spec.c_str(), owned.release(), help);
  display_->add(parser_->options().back());
  return *this;
}

options_description& options_description::add_option(const std::string& spec, const char* help) {
  claim(spec);
  parser_->add_options()(spec.c_str(), help);
  display_->add(parser_->options().back());
  return *this;
}

options_description& options_description::add_flag(const std::string& on_name,
                                                   const std::string& off_name, bool* flag,
                                                   const char* on_help, const char* off_help) {
  claim(on_name);
  claim(off_name);
  parser_->add_options()
    (on_name.c_str(), po::value(flag)->implicit_value(true)->zero_tokens(), on_help)
    (off_name.c_str(), po::value(flag)->implicit_value(false)->zero_tokens(), off_help);

  const auto& options = parser_->options();
  display_->add(*flag ? options.back() : options[options.size() - 2]);
  return *this;
}

options_description& options_description::add(const options_description& other) {
  for (const std::string& name : *other.names_) {
    if (!names_->insert(name).second) {
      throw util::Exception("Option {} is defined twice", name);
    }
  }
  parser_->add(*other.parser_);
  display_->add(*other.display_);
  return *this;
}

void options_description::claim(const std::string& spec) {
  size_t comma = spec.find(',');
  std::vector<std::string> names{"--" + spec.substr(0, comma)};
  if (comma != std::string::npos) {
    names.push_back("-" + spec.substr(comma + 1));
  }
  for (const std::string& name : names) {
    if (!names_->insert(name).second) {
      throw util::Exception("Option {} is defined twice", name);
    }
  }
}

namespace {

template <typename Parser>
po::variables_map store_and_notify(Parser&& parser, const options_description& desc) {
  po::variables_map vm;
  try {
    po::store(parser.options(desc.parser()).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace

po::variables_map parse_args(const options_description& desc, int argc, const char* const argv[]) {
  return store_and_notify(po::command_line_parser(argc, argv), desc);
}

po::variables_map parse_args(const options_description& desc,
                             const std::vector<std::string>& args) {
  return store_and_notify(po::command_line_parser(args), desc);
}

}  // namespace program_options

}  // namespace boost_util
