#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Bad command line; the message is meant for the user.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Maps argv onto a SettingsManager. Options are "--key", "--key value",
// "--key=value" or a short alias "-k"; flags take an optional boolean
// literal. Bare words fill the settings that declare a "position". "--"
// ends option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "zktree");

  // Throws UsageError on unknown options, bad values or surplus arguments.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  // Returns the number of extra arguments the option consumed.
  std::size_t apply_option(const std::string& token,
                           const std::string* next,
                           SettingsManager& settings) const;
  static bool looks_like_option(const std::string& token);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
};
