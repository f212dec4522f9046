#include "conflict_resolver.hpp"

ConflictAction decide(bool exists_at_destination,
                      ConflictPolicy policy,
                      const PromptFn& prompt,
                      const std::string& path) {
  if(!exists_at_destination) return ConflictAction::Write;

  switch(policy) {
    case ConflictPolicy::Overwrite:
      return ConflictAction::Write;
    case ConflictPolicy::NoClobber:
      return ConflictAction::Skip;
    case ConflictPolicy::Interactive:
      break;
  }
  if(!prompt) return ConflictAction::Abort;
  switch(prompt(path)) {
    case PromptAnswer::Write: return ConflictAction::Write;
    case PromptAnswer::Skip: return ConflictAction::Skip;
    case PromptAnswer::AbortAll: break;
  }
  return ConflictAction::Abort;
}

const char* policy_name(ConflictPolicy policy) {
  switch(policy) {
    case ConflictPolicy::NoClobber: return "no-clobber";
    case ConflictPolicy::Interactive: return "interactive";
    case ConflictPolicy::Overwrite: return "overwrite";
  }
  return "unknown";
}

const char* action_name(ConflictAction action) {
  switch(action) {
    case ConflictAction::Write: return "write";
    case ConflictAction::Skip: return "skip";
    case ConflictAction::Abort: return "abort";
  }
  return "unknown";
}

std::optional<ConflictPolicy> parse_policy(const std::string& text) {
  if(text == "no-clobber" || text == "no_clobber") return ConflictPolicy::NoClobber;
  if(text == "interactive") return ConflictPolicy::Interactive;
  if(text == "overwrite") return ConflictPolicy::Overwrite;
  return std::nullopt;
}
