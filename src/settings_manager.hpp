#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Every setting the tool understands.
//  "group"      flags sharing a group are mutually exclusive (action, policy)
//  "position"   index of the positional argument that fills the setting
//  "persistent" whether --save writes it; per-run switches never are
//  "min"/"max"  bounds for int settings
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","print"},              {"aliases", {"p"}},              {"type","bool"},   {"default",false}, {"group","action"}, {"persistent",false}, {"description","Print the ZNodes under the source location (default action)"}},
  {{"key","copy"},               {"aliases", {"c"}},              {"type","bool"},   {"default",false}, {"group","action"}, {"persistent",false}, {"description","Copy the source subtree to the destination location"}},
  {{"key","export"},             {"aliases", {"x"}},              {"type","bool"},   {"default",false}, {"group","action"}, {"persistent",false}, {"description","Write the source subtree to --file"}},
  {{"key","import"},             {"aliases", {"i"}},              {"type","bool"},   {"default",false}, {"group","action"}, {"persistent",false}, {"description","Write the subtree stored in --file under the location"}},
  {{"key","serve"},              {"aliases", {"s"}},              {"type","bool"},   {"default",false}, {"group","action"}, {"persistent",false}, {"description","Host an in-memory store loaded from --snapshot"}},
  {{"key","no_clobber"},         {"aliases", {"no-clobber","n"}}, {"type","bool"},   {"default",false}, {"group","policy"}, {"persistent",false}, {"description","Skip ZNodes that already exist (default policy)"}},
  {{"key","interactive"},        {"aliases", nlohmann::json::array()}, {"type","bool"}, {"default",false}, {"group","policy"}, {"persistent",false}, {"description","Ask before overwriting each existing ZNode"}},
  {{"key","overwrite"},          {"aliases", {"o"}},              {"type","bool"},   {"default",false}, {"group","policy"}, {"persistent",false}, {"description","Overwrite existing ZNodes without asking"}},
  {{"key","file"},               {"aliases", {"f"}},              {"type","string"}, {"default",""},    {"persistent",false}, {"description","Document read by import or written by export"}},
  {{"key","source"},             {"aliases", {"src"}},            {"type","string"}, {"default",""},    {"position",0}, {"persistent",false}, {"description","Source location host:port/path"}},
  {{"key","destination"},        {"aliases", {"dst"}},            {"type","string"}, {"default",""},    {"position",1}, {"persistent",false}, {"description","Destination location host:port/path"}},
  {{"key","verbose"},            {"aliases", {"v"}},              {"type","bool"},   {"default",false}, {"persistent",true},  {"description","Enable debug output"}},
  {{"key","write_retries"},      {"aliases", {"retries"}},        {"type","int"},    {"default",3},     {"min",0}, {"max",100},   {"persistent",true}, {"description","Retries for a store call hitting a transient failure"}},
  {{"key","retry_backoff_ms"},   {"aliases", {"backoff"}},        {"type","int"},    {"default",200},   {"min",0}, {"max",60000}, {"persistent",true}, {"description","Base delay between retries; grows linearly"}},
  {{"key","max_depth"},          {"aliases", {"depth","d"}},      {"type","int"},    {"default",0},     {"min",0},                {"persistent",true}, {"description","Deepest level printed or exported (0 = unlimited)"}},
  {{"key","data_display_limit"}, {"aliases", {"ddl"}},            {"type","int"},    {"default",256},   {"min",0},                {"persistent",true}, {"description","Longest text payload printed verbatim (0 = no limit)"}},
  {{"key","create_parents"},     {"aliases", {"makepath"}},       {"type","bool"},   {"default",true},  {"persistent",true},  {"description","Create missing parents of the destination path"}},
  {{"key","listen_ip"},          {"aliases", {"li"}},             {"type","string"}, {"default","127.0.0.1"}, {"persistent",true}, {"description","Address the store server binds"}},
  {{"key","listen_port"},        {"aliases", {"lp"}},             {"type","int"},    {"default",2181},  {"min",0}, {"max",65535}, {"persistent",true}, {"description","TCP port the store server listens on"}},
  {{"key","snapshot"},           {"aliases", nlohmann::json::array()}, {"type","string"}, {"default",""}, {"persistent",true}, {"description","Snapshot document served by --serve"}},
  {{"key","help"},               {"aliases", {"h","?"}},          {"type","bool"},   {"default",false}, {"persistent",false}, {"description","Show command help and exit"}},
  {{"key","save"},               {"aliases", {"persist"}},        {"type","bool"},   {"default",false}, {"persistent",false}, {"description","Persist current settings to disk"}}
});

class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  struct Spec {
    std::string key;
    std::vector<std::string> aliases;  // lower-case
    Type type = Type::String;
    nlohmann::json default_value;
    std::string group;
    std::optional<std::size_t> position;
    std::optional<int> min_value;
    std::optional<int> max_value;
    bool persistent = true;
    std::string description;
  };

  SettingsManager();
  // Throws std::invalid_argument for a malformed specification table.
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  // On failure the value is left unchanged and error says why.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Keys of the given group whose flag is set, in table order.
  std::vector<std::string> selected(const std::string& group) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  // Matches a key or alias, case-insensitively.
  const Spec* find(const std::string& token) const;
  // Setting filled by the positional argument at index, if any.
  const Spec* at_position(std::size_t index) const;
  const std::vector<Spec>& specs() const { return specs_; }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);
  // A missing file is not an error; load() then returns false.
  bool load();
  bool save() const;

  nlohmann::json persistent_json() const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  static std::vector<Spec> parse_specification(const nlohmann::json& specification);

  bool store(const Spec& spec, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> from_text(const Spec& spec, const std::string& text, std::string& error);

  std::vector<Spec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::Spec> SettingsManager::parse_specification(const nlohmann::json& specification) {
  std::vector<Spec> result;
  for(const auto& entry : specification) {
    Spec spec;
    spec.key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    if(type == "bool") spec.type = Type::Bool;
    else if(type == "int") spec.type = Type::Int;
    else if(type == "string") spec.type = Type::String;
    else throw std::invalid_argument("Setting '" + spec.key + "' has unknown type '" + type + "'");

    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      spec.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    spec.default_value = entry.at("default");
    spec.group = entry.value("group", "");
    if(!spec.group.empty() && spec.type != Type::Bool) {
      throw std::invalid_argument("Grouped setting '" + spec.key + "' must be a flag");
    }
    if(entry.contains("position")) spec.position = entry.at("position").get<std::size_t>();
    if(entry.contains("min")) spec.min_value = entry.at("min").get<int>();
    if(entry.contains("max")) spec.max_value = entry.at("max").get<int>();
    spec.persistent = entry.value("persistent", true);
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(parse_specification(specification)) {
  for(const auto& spec : specs_) {
    values_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::Spec* SettingsManager::find(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key) ||
       std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline const SettingsManager::Spec* SettingsManager::at_position(std::size_t index) const {
  for(const auto& spec : specs_) {
    if(spec.position && *spec.position == index) return &spec;
  }
  return nullptr;
}

inline std::vector<std::string> SettingsManager::selected(const std::string& group) const {
  std::vector<std::string> keys;
  for(const auto& spec : specs_) {
    if(spec.group == group && values_.at(spec.key).get<bool>()) {
      keys.push_back(spec.key);
    }
  }
  return keys;
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

// Only persistent keys are taken from the file; a stale file must not be
// able to select an action or a location.
inline bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_json().dump(2) << "\n";
  return static_cast<bool>(out);
}

inline nlohmann::json SettingsManager::persistent_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(spec.persistent) doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::store(const Spec& spec, const nlohmann::json& value, std::string& error) {
  switch(spec.type) {
    case Type::Bool:
      if(!value.is_boolean()) {
        error = "expected true or false";
        return false;
      }
      break;
    case Type::Int: {
      if(!value.is_number_integer()) {
        error = "expected an integer";
        return false;
      }
      const auto number = value.get<long long>();
      if((spec.min_value && number < *spec.min_value) ||
         (spec.max_value && number > *spec.max_value)) {
        error = "out of range";
        if(spec.min_value) error += " (min " + std::to_string(*spec.min_value) + ")";
        if(spec.max_value) error += " (max " + std::to_string(*spec.max_value) + ")";
        return false;
      }
      break;
    }
    case Type::String:
      if(!value.is_string()) {
        error = "expected a string";
        return false;
      }
      break;
  }
  values_[spec.key] = value;
  return true;
}

inline std::optional<nlohmann::json> SettingsManager::from_text(const Spec& spec,
                                                                const std::string& text,
                                                                std::string& error) {
  const std::string clean = trim_copy(text);
  switch(spec.type) {
    case Type::Bool: {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return nlohmann::json(true);
      if(v == "false" || v == "0" || v == "off" || v == "no") return nlohmann::json(false);
      error = "expected true|false|on|off";
      return std::nullopt;
    }
    case Type::Int:
      try {
        std::size_t consumed = 0;
        const int number = std::stoi(clean, &consumed);
        if(consumed != clean.size()) {
          error = "trailing characters after integer";
          return std::nullopt;
        }
        return nlohmann::json(number);
      } catch(const std::logic_error&) {
        error = "'" + clean + "' is not an integer";
        return std::nullopt;
      }
    case Type::String:
      return nlohmann::json(clean);
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = from_text(*spec, value, error);
  return parsed && store(*spec, *parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  return store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!values_.contains(key)) {
    throw std::out_of_range("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
