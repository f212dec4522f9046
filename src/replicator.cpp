#include "replicator.hpp"

#include <thread>

#include "utils.hpp"

Replicator::Replicator(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)) {}

template<typename Fn>
auto Replicator::with_retries(const std::string& path, const char* what, Fn&& fn, bool* retried)
  -> decltype(fn()) {
  for(std::size_t attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch(const StoreError& e) {
      if(!e.transient() || attempt >= options_.write_retries) throw;
      if(retried) *retried = true;
      log_warn(logger_.get(), "Transient failure during {} of {} (attempt {}/{}): {}",
               what, path, attempt + 1, options_.write_retries + 1, e.what());
      std::this_thread::sleep_for(options_.retry_backoff * static_cast<int>(attempt + 1));
    }
  }
}

void Replicator::record_failure(ReplicationSummary& summary,
                                const std::string& path,
                                ErrorKind kind,
                                const std::string& message) {
  summary.failed++;
  summary.failures.push_back(NodeFailure{path, kind, message});
  log_error(logger_.get(), "Failed to replicate {}: {}", path, message);
}

void Replicator::ensure_anchor(TreeStore& destination, const std::string& destination_root) {
  if(!options_.create_parents || destination_root == "/") return;

  std::vector<std::string> missing;
  try {
    for(auto parent = parent_node_path(destination_root);
        parent != "/" && !with_retries(parent, "exists", [&]{ return destination.exists(parent); });
        parent = parent_node_path(parent)) {
      missing.push_back(parent);
    }
    for(auto it = missing.rbegin(); it != missing.rend(); ++it) {
      const auto& path = *it;
      try {
        with_retries(path, "create", [&]{ destination.create(path, std::string()); });
        log_info(logger_.get(), "Created parent ZNode at {}", path);
      } catch(const StoreError& e) {
        if(e.code() != StoreErrorCode::NodeExists) throw;
      }
    }
  } catch(const StoreError& e) {
    throw TreeError(ErrorKind::RootFailure, destination_root,
                    std::string("cannot prepare destination parents: ") + e.what());
  }
}

Replicator::Outcome Replicator::apply(const NodeRecord& record,
                                      const std::string& destination_path,
                                      TreeStore& destination,
                                      NodeState& state) {
  bool exists = with_retries(destination_path, "exists",
                             [&]{ return destination.exists(destination_path); });
  state.present = exists;

  for(;;) {
    const auto action = decide(exists, options_.policy, options_.prompt, destination_path);
    if(action == ConflictAction::Abort) {
      return Outcome::Aborted;
    }
    if(action == ConflictAction::Skip) {
      log_debug(logger_.get(), "ZNode at {} already exists. Skipping due to --{}",
                destination_path, policy_name(options_.policy));
      return Outcome::Skipped;
    }

    if(exists) {
      log_debug(logger_.get(), "Overwriting ZNode data at {}", destination_path);
      with_retries(destination_path, "set",
                   [&]{ destination.set_data(destination_path, record.data); });
      return Outcome::Written;
    }

    bool retried = false;
    try {
      with_retries(destination_path, "create",
                   [&]{ destination.create(destination_path, record.data); }, &retried);
      state.present = true;
      log_info(logger_.get(), "Writing new ZNode at {}", destination_path);
      return Outcome::Written;
    } catch(const StoreError& e) {
      if(e.code() != StoreErrorCode::NodeExists) throw;
      state.present = true;
      if(retried) {
        // An earlier attempt may have landed before its reply was lost;
        // finish the intended write in place.
        with_retries(destination_path, "set",
                     [&]{ destination.set_data(destination_path, record.data); });
        return Outcome::Written;
      }
      log_info(logger_.get(), "ZNode at {} appeared concurrently; resolving as a conflict",
               destination_path);
      exists = true;
    }
  }
}

ReplicationSummary Replicator::replicate(NodeSource& source,
                                         TreeStore& destination,
                                         const std::string& destination_root) {
  const std::string dest_root = normalize_node_path(destination_root);
  const std::string& source_root = source.root_path();
  log_info(logger_.get(), "Replicating {} -> {}{} ({})",
           source_root, destination.describe(), dest_root, policy_name(options_.policy));

  ensure_anchor(destination, dest_root);

  ReplicationSummary summary;
  std::optional<std::string> blocked;
  for(;;) {
    std::optional<NodeRecord> record;
    try {
      record = source.next();
    } catch(const TreeError& e) {
      if(e.kind() != ErrorKind::NodeVanished) throw;
      if(e.path() == source_root) {
        throw TreeError(ErrorKind::RootFailure, dest_root, e.what());
      }
      record_failure(summary, rebase_node_path(e.path(), source_root, dest_root),
                     ErrorKind::NodeVanished, e.what());
      continue;
    }
    if(!record) break;

    const bool is_root = (record->path == source_root);
    const std::string dest_path = rebase_node_path(record->path, source_root, dest_root);

    if(blocked && is_same_or_descendant(record->path, *blocked)) {
      record_failure(summary, dest_path, ErrorKind::WriteFailure,
                     "parent " + rebase_node_path(*blocked, source_root, dest_root) +
                     " was not replicated");
      continue;
    }
    blocked.reset();

    NodeState state;
    Outcome outcome = Outcome::Skipped;
    try {
      outcome = apply(*record, dest_path, destination, state);
    } catch(const StoreError& e) {
      if(is_root) {
        throw TreeError(ErrorKind::RootFailure, dest_path, e.what());
      }
      record_failure(summary, dest_path, ErrorKind::WriteFailure, e.what());
      if(!state.present) blocked = record->path;
      continue;
    }

    if(outcome == Outcome::Aborted) {
      summary.aborted = true;
      log_warn(logger_.get(), "Replication aborted at {}", dest_path);
      break;
    }
    if(outcome == Outcome::Written) {
      summary.written++;
    } else {
      summary.skipped++;
    }
  }

  log_info(logger_.get(), "Replication finished: {} written, {} skipped, {} failed{}",
           summary.written, summary.skipped, summary.failed,
           summary.aborted ? " (aborted)" : "");
  return summary;
}
