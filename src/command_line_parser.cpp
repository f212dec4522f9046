#include "command_line_parser.hpp"

#include <cctype>
#include <optional>

#include "log.hpp"

namespace {

const char* type_hint(SettingsManager::Type type) {
  switch(type) {
    case SettingsManager::Type::Bool: return "";
    case SettingsManager::Type::Int: return "<int>";
    case SettingsManager::Type::String: return "<text>";
  }
  return "";
}

std::string alias_list(const SettingsManager::Spec& spec) {
  std::string out;
  for(const auto& alias : spec.aliases) {
    out += out.empty() ? " (" : ", ";
    out += (alias.size() > 2 ? "--" : "-") + alias;
  }
  if(!out.empty()) out += ")";
  return out;
}

std::string default_text(const SettingsManager::Spec& spec) {
  if(spec.default_value.is_string()) {
    const auto text = spec.default_value.get<std::string>();
    return text.empty() ? std::string() : " [" + text + "]";
  }
  if(spec.type == SettingsManager::Type::Bool) {
    return spec.default_value.get<bool>() ? " [on]" : std::string();
  }
  return " [" + spec.default_value.dump() + "]";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(token[1])) || token[1] == '?');
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  const std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t position = 0;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }
    if(!options_done && looks_like_option(token)) {
      const std::string* next = (i + 1 < args.size()) ? &args[i + 1] : nullptr;
      i += apply_option(token, next, settings);
      continue;
    }

    const auto* spec = settings.at_position(position);
    if(!spec) {
      throw UsageError("Unexpected argument '" + token + "'");
    }
    std::string error;
    if(!settings.set_from_string(spec->key, token, error)) {
      throw UsageError("Invalid " + spec->key + " '" + token + "': " + error);
    }
    ++position;
  }
}

std::size_t CommandLineParser::apply_option(const std::string& token,
                                            const std::string* next,
                                            SettingsManager& settings) const {
  const bool long_form = token.rfind("--", 0) == 0;
  std::string name = token.substr(long_form ? 2 : 1);
  std::optional<std::string> inline_value;
  if(long_form) {
    const auto eq = name.find('=');
    if(eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name.erase(eq);
    }
  }

  const auto* spec = settings.find(name);
  if(!spec) {
    throw UsageError("Unknown option " + token);
  }

  std::string value;
  std::size_t consumed = 0;
  if(inline_value) {
    value = *inline_value;
  } else if(spec->type == SettingsManager::Type::Bool) {
    if(next && is_bool_literal(*next)) {
      value = *next;
      consumed = 1;
    } else {
      value = "true";
    }
  } else {
    if(!next) {
      throw UsageError("Missing value for " + token);
    }
    value = *next;
    consumed = 1;
  }

  std::string error;
  if(!settings.set_from_string(spec->key, value, error)) {
    throw UsageError("Invalid value for " + token + ": " + error);
  }
  return consumed;
}

void CommandLineParser::usage() const {
  const auto& p = process_name_;
  print_out(nullptr, "{} - print, copy, export and import ZNode subtrees", p);
  print_out(nullptr, "");
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [--print] source", p);
  print_out(nullptr, "  {} --copy [--no-clobber|--interactive|--overwrite] source destination", p);
  print_out(nullptr, "  {} --export --file FILE source", p);
  print_out(nullptr, "  {} --import [--no-clobber|--interactive|--overwrite] --file FILE destination", p);
  print_out(nullptr, "  {} --serve [--snapshot FILE] [--listen_port N]", p);
  print_out(nullptr, "");
  print_out(nullptr, "Locations are host:port/path, e.g. zookeeper1:2181/path/to/target");
  print_out(nullptr, "Examples:");
  print_out(nullptr, "  # Copy ZNodes under /path/to/src on zookeeper1 into /path/to/dst on zookeeper2, skipping existing ones");
  print_out(nullptr, "  {} --copy --no-clobber zookeeper1:2181/path/to/src zookeeper2:2181/path/to/dst", p);
  print_out(nullptr, "  # Export ZNodes under /path/to/export into exported_znodes.json");
  print_out(nullptr, "  {} --export --file exported_znodes.json zookeeper1:2181/path/to/export", p);

  const SettingsManager defaults;
  auto section = [&](const char* title, auto&& include) {
    print_out(nullptr, "");
    print_out(nullptr, "{}:", title);
    for(const auto& spec : defaults.specs()) {
      if(!include(spec) || spec.position) continue;
      print_out(nullptr, "  --{:<20} {:<7} {}{}{}",
                spec.key, type_hint(spec.type), spec.description,
                alias_list(spec), default_text(spec));
    }
  };
  section("Actions (pick one)", [](const SettingsManager::Spec& s){ return s.group == "action"; });
  section("Conflict policy (pick one)", [](const SettingsManager::Spec& s){ return s.group == "policy"; });
  section("Options", [](const SettingsManager::Spec& s){ return s.group.empty(); });
  print_out(nullptr, "");
  print_out(nullptr, "Exit status: 0 success, 1 some ZNodes failed or the run was aborted, 2 fatal error");
}
