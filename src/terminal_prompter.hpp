#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "conflict_resolver.hpp"

// Asks the user how to resolve a conflict. Uses readline when available,
// plain line input otherwise. End of input counts as abort.
class TerminalPrompter {
public:
  TerminalPrompter();
  // Reads answers from in and writes prompts to out instead of the terminal.
  TerminalPrompter(std::istream& in, std::ostream& out);

  PromptAnswer operator()(const std::string& path);

  static std::optional<PromptAnswer> parse_answer(const std::string& line);

private:
  std::optional<std::string> read_line(const std::string& prompt);

  std::istream* in_ = nullptr;
  std::ostream* out_ = nullptr;
};
