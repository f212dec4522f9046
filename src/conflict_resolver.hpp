#pragma once

#include <functional>
#include <optional>
#include <string>

enum class ConflictPolicy { NoClobber, Interactive, Overwrite };
enum class ConflictAction { Write, Skip, Abort };
// Answers of the interactive prompt; AbortAll ends the whole run.
enum class PromptAnswer { Write, Skip, AbortAll };

using PromptFn = std::function<PromptAnswer(const std::string& path)>;

// Decides what to do with one destination node. Pure apart from the
// injected prompt, which is consulted only for an Interactive conflict.
// An Interactive conflict without a prompt aborts.
ConflictAction decide(bool exists_at_destination,
                      ConflictPolicy policy,
                      const PromptFn& prompt,
                      const std::string& path);

const char* policy_name(ConflictPolicy policy);
const char* action_name(ConflictAction action);
std::optional<ConflictPolicy> parse_policy(const std::string& text);
