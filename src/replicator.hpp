#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "conflict_resolver.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "node_source.hpp"
#include "tree_store.hpp"

struct NodeFailure {
  std::string path;
  ErrorKind kind = ErrorKind::WriteFailure;
  std::string message;
};

struct ReplicationSummary {
  std::size_t written = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  bool aborted = false;
  std::vector<NodeFailure> failures;

  std::size_t processed() const { return written + skipped + failed; }
  bool succeeded() const { return failed == 0 && !aborted; }
};

// Applies a pre-order node stream onto a destination store, one node at a
// time. Copies are additive: destination nodes absent from the source are
// never removed.
class Replicator {
public:
  struct Options {
    ConflictPolicy policy = ConflictPolicy::NoClobber;
    PromptFn prompt;
    // Extra attempts for a store call failing with a transient error.
    std::size_t write_retries = 3;
    std::chrono::milliseconds retry_backoff{200};
    // Create missing ancestors of the destination root with empty data.
    bool create_parents = true;
  };

  explicit Replicator(Options options, std::shared_ptr<Logger> logger = nullptr);

  // Per-node failures are counted and the run continues; any failure on the
  // root node throws TreeError(RootFailure). An abort decision ends the run
  // and returns what was processed before it.
  ReplicationSummary replicate(NodeSource& source,
                               TreeStore& destination,
                               const std::string& destination_root);

  const Options& options() const { return options_; }

private:
  enum class Outcome { Written, Skipped, Aborted };

  // Tracks whether the destination node is known to exist, so a failure
  // can tell if descendants still have a parent to attach to.
  struct NodeState {
    bool present = false;
  };

  Outcome apply(const NodeRecord& record,
                const std::string& destination_path,
                TreeStore& destination,
                NodeState& state);
  void ensure_anchor(TreeStore& destination, const std::string& destination_root);
  void record_failure(ReplicationSummary& summary,
                      const std::string& path,
                      ErrorKind kind,
                      const std::string& message);

  template<typename Fn>
  auto with_retries(const std::string& path, const char* what, Fn&& fn, bool* retried = nullptr)
    -> decltype(fn());

  Options options_;
  std::shared_ptr<Logger> logger_;
};
