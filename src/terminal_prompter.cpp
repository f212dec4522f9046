#include "terminal_prompter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "settings_manager.hpp"

TerminalPrompter::TerminalPrompter() = default;

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out)
  : in_(&in), out_(&out) {}

std::optional<PromptAnswer> TerminalPrompter::parse_answer(const std::string& line) {
  auto answer = SettingsManager::to_lower(SettingsManager::trim_copy(line));
  if(answer == "y" || answer == "yes") return PromptAnswer::Write;
  if(answer == "n" || answer == "no") return PromptAnswer::Skip;
  if(answer == "a" || answer == "abort") return PromptAnswer::AbortAll;
  return std::nullopt;
}

std::optional<std::string> TerminalPrompter::read_line(const std::string& prompt) {
  if(in_) {
    *out_ << prompt;
    out_->flush();
    std::string line;
    if(!std::getline(*in_, line)) return std::nullopt;
    return line;
  }
#ifdef HAVE_READLINE
  char* line = readline(prompt.c_str());
  if(!line) return std::nullopt;
  std::string result(line);
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

PromptAnswer TerminalPrompter::operator()(const std::string& path) {
  const std::string prompt = "ZNode at " + path +
    " already exists at destination. Overwrite? (y)es/(n)o/(a)bort: ";
  for(;;) {
    auto line = read_line(prompt);
    if(!line) return PromptAnswer::AbortAll;
    if(auto answer = parse_answer(*line)) return *answer;
  }
}
