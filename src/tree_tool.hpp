#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "conflict_resolver.hpp"
#include "log.hpp"
#include "replicator.hpp"
#include "settings_manager.hpp"
#include "tree_store.hpp"
#include "tree_walker.hpp"

inline constexpr int kExitOk = 0;
inline constexpr int kExitNodeFailures = 1;
inline constexpr int kExitFatal = 2;

enum class Action { Print, Copy, Export, Import, Serve };

const char* action_label(Action action);

// One validated invocation, derived from settings.
struct RunPlan {
  Action action = Action::Print;
  ConflictPolicy policy = ConflictPolicy::NoClobber;
  std::optional<StoreAddress> source;
  std::optional<StoreAddress> destination;
  std::filesystem::path file;
};

// Drives one PRINT/COPY/EXPORT/IMPORT/SERVE run. Stores are opened per run
// and released when the run returns.
class TreeTool {
public:
  using StoreFactory = std::function<std::shared_ptr<TreeStore>(const StoreAddress&)>;
  using OutputFn = std::function<void(const std::string&)>;

  struct Options {
    // Defaults to a connected RemoteStore.
    StoreFactory store_factory;
    // Defaults to a TerminalPrompter.
    PromptFn prompt;
    // Receives PRINT output blocks; defaults to the logger's print channel.
    OutputFn output;
  };

  TreeTool(std::shared_ptr<SettingsManager> settings, Options options);
  explicit TreeTool(std::shared_ptr<SettingsManager> settings);

  // Throws UsageError for contradictory or incomplete settings.
  static RunPlan plan(const SettingsManager& settings);

  // Returns a process exit status: kExitOk, kExitNodeFailures or kExitFatal.
  // UsageError propagates.
  int run();
  int execute(const RunPlan& plan);

  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  const std::optional<ReplicationSummary>& last_summary() const { return last_summary_; }

private:
  int run_print(const StoreAddress& source);
  int run_copy(const StoreAddress& source, const StoreAddress& destination, ConflictPolicy policy);
  int run_export(const StoreAddress& source, const std::filesystem::path& file);
  int run_import(const std::filesystem::path& file, const StoreAddress& destination, ConflictPolicy policy);
  int run_serve();

  std::shared_ptr<TreeStore> open_store(const StoreAddress& address);
  Replicator make_replicator(ConflictPolicy policy) const;
  int report(const ReplicationSummary& summary);
  int walk_status(const TreeWalker& walker);

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::optional<ReplicationSummary> last_summary_;
};
