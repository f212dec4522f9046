#include "tree_tool.hpp"

#include <stdexcept>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "memory_store.hpp"
#include "printer.hpp"
#include "remote_store.hpp"
#include "serializer.hpp"
#include "store_server.hpp"
#include "terminal_prompter.hpp"
#include "tree_walker.hpp"

namespace {

StoreAddress address_setting(const SettingsManager& settings, const std::string& key) {
  auto text = settings.get<std::string>(key);
  if(text.empty()) {
    throw UsageError("Missing " + key + " location");
  }
  try {
    return parse_store_address(text);
  } catch(const std::invalid_argument& e) {
    throw UsageError(e.what());
  }
}

} // namespace

const char* action_label(Action action) {
  switch(action) {
    case Action::Print: return "PRINT";
    case Action::Copy: return "COPY";
    case Action::Export: return "EXPORT";
    case Action::Import: return "IMPORT";
    case Action::Serve: return "SERVE";
  }
  return "UNKNOWN";
}

TreeTool::TreeTool(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(std::make_shared<Logger>("zk-util")) {
  if(!options_.store_factory) {
    auto logger = logger_;
    options_.store_factory = [logger](const StoreAddress& address) {
      auto store = std::make_shared<RemoteStore>(address, logger);
      store->connect();
      return std::static_pointer_cast<TreeStore>(store);
    };
  }
  if(!options_.prompt) {
    options_.prompt = TerminalPrompter();
  }
  if(!options_.output) {
    auto logger = logger_;
    options_.output = [logger](const std::string& block) {
      logger->print("{}", block);
    };
  }
}

TreeTool::TreeTool(std::shared_ptr<SettingsManager> settings)
  : TreeTool(std::move(settings), Options{}) {}

RunPlan TreeTool::plan(const SettingsManager& settings) {
  RunPlan plan;

  const auto actions = settings.selected("action");
  if(actions.size() > 1) {
    throw UsageError("Specify at most one of --print, --copy, --export, --import, --serve");
  }
  if(!actions.empty()) {
    const auto& key = actions.front();
    if(key == "copy") plan.action = Action::Copy;
    else if(key == "export") plan.action = Action::Export;
    else if(key == "import") plan.action = Action::Import;
    else if(key == "serve") plan.action = Action::Serve;
  }

  const auto policies = settings.selected("policy");
  if(policies.size() > 1) {
    throw UsageError("Specify at most one of --no-clobber, --interactive, --overwrite");
  }
  if(!policies.empty()) {
    if(auto policy = parse_policy(policies.front())) plan.policy = *policy;
  }

  const auto file = settings.get<std::string>("file");
  const bool has_destination = !settings.get<std::string>("destination").empty();
  switch(plan.action) {
    case Action::Print:
    case Action::Copy:
      if(!file.empty()) {
        throw UsageError("--file should not be used with PRINT or COPY actions.");
      }
      plan.source = address_setting(settings, "source");
      if(plan.action == Action::Copy) {
        plan.destination = address_setting(settings, "destination");
      } else if(has_destination) {
        throw UsageError("PRINT takes a single location");
      }
      break;
    case Action::Export:
      if(file.empty()) throw UsageError("EXPORT requires --file");
      if(has_destination) throw UsageError("EXPORT takes a single location");
      plan.source = address_setting(settings, "source");
      plan.file = file;
      break;
    case Action::Import:
      if(file.empty()) throw UsageError("IMPORT requires --file");
      // The single location given to import is where nodes are written.
      if(has_destination) {
        if(!settings.get<std::string>("source").empty()) {
          throw UsageError("IMPORT takes a single location");
        }
        plan.destination = address_setting(settings, "destination");
      } else {
        plan.destination = address_setting(settings, "source");
      }
      plan.file = file;
      break;
    case Action::Serve:
      if(!file.empty() || has_destination || !settings.get<std::string>("source").empty()) {
        throw UsageError("SERVE takes no locations; use --snapshot");
      }
      break;
  }
  return plan;
}

int TreeTool::run() {
  init(settings_->get<bool>("verbose"));
  return execute(plan(*settings_));
}

int TreeTool::execute(const RunPlan& plan) {
  const char* label = action_label(plan.action);
  logger_->info("Running action: {}", label);
  last_summary_.reset();

  int status = kExitFatal;
  try {
    switch(plan.action) {
      case Action::Print:
        status = run_print(*plan.source);
        break;
      case Action::Copy:
        status = run_copy(*plan.source, *plan.destination, plan.policy);
        break;
      case Action::Export:
        status = run_export(*plan.source, plan.file);
        break;
      case Action::Import:
        status = run_import(plan.file, *plan.destination, plan.policy);
        break;
      case Action::Serve:
        status = run_serve();
        break;
    }
  } catch(const TreeError& e) {
    logger_->error("{} failed: {}", label, e.what());
    return kExitFatal;
  } catch(const StoreError& e) {
    logger_->error("{} failed: {}", label, e.what());
    return kExitFatal;
  } catch(const std::runtime_error& e) {
    // File I/O on the document.
    logger_->error("{} failed: {}", label, e.what());
    return kExitFatal;
  }
  logger_->info("Completed action: {}", label);
  return status;
}

std::shared_ptr<TreeStore> TreeTool::open_store(const StoreAddress& address) {
  auto store = options_.store_factory(address);
  if(!store) {
    throw StoreError(StoreErrorCode::ConnectionLoss, address.path,
                     "no store available at " + address.endpoint());
  }
  return store;
}

Replicator TreeTool::make_replicator(ConflictPolicy policy) const {
  Replicator::Options options;
  options.policy = policy;
  options.prompt = options_.prompt;
  options.write_retries = static_cast<std::size_t>(settings_->get<int>("write_retries"));
  options.retry_backoff = std::chrono::milliseconds(settings_->get<int>("retry_backoff_ms"));
  options.create_parents = settings_->get<bool>("create_parents");
  return Replicator(std::move(options), logger_);
}

int TreeTool::report(const ReplicationSummary& summary) {
  last_summary_ = summary;
  logger_->print("{} written, {} skipped, {} failed{}",
                 summary.written, summary.skipped, summary.failed,
                 summary.aborted ? std::string(" (") + error_kind_name(ErrorKind::ConflictAbort) + ")" : "");
  for(const auto& failure : summary.failures) {
    logger_->print_err("  {} {}: {}", error_kind_name(failure.kind), failure.path, failure.message);
  }
  return summary.succeeded() ? kExitOk : kExitNodeFailures;
}

int TreeTool::walk_status(const TreeWalker& walker) {
  if(walker.vanished() == 0) return kExitOk;
  logger_->print_err("{} node(s) under {} vanished during the walk",
                     walker.vanished(), walker.root_path());
  return kExitNodeFailures;
}

int TreeTool::run_print(const StoreAddress& source) {
  auto store = open_store(source);
  TreeWalker::Options walk;
  walk.max_depth = static_cast<std::size_t>(settings_->get<int>("max_depth"));
  TreeWalker walker(*store, source.path, walk, logger_);

  Printer::Options print_options;
  print_options.data_display_limit = static_cast<std::size_t>(settings_->get<int>("data_display_limit"));
  Printer printer(print_options);
  auto printed = printer.stream(walker, options_.output);
  logger_->debug("Printed {} nodes", printed);
  return walk_status(walker);
}

int TreeTool::run_copy(const StoreAddress& source,
                       const StoreAddress& destination,
                       ConflictPolicy policy) {
  auto source_store = open_store(source);
  auto destination_store = open_store(destination);
  TreeWalker walker(*source_store, source.path, TreeWalker::Options{}, logger_);
  auto replicator = make_replicator(policy);
  return report(replicator.replicate(walker, *destination_store, destination.path));
}

int TreeTool::run_export(const StoreAddress& source, const std::filesystem::path& file) {
  auto store = open_store(source);
  TreeWalker::Options walk;
  walk.max_depth = static_cast<std::size_t>(settings_->get<int>("max_depth"));
  TreeWalker walker(*store, source.path, walk, logger_);
  auto document = to_document(walker, logger_.get());
  write_document_file(file, document);
  logger_->info("Exported {} nodes from {} to {}", walker.emitted(), source.path, file.string());
  return walk_status(walker);
}

int TreeTool::run_import(const std::filesystem::path& file,
                         const StoreAddress& destination,
                         ConflictPolicy policy) {
  // Validate the document before touching the destination.
  auto document = read_document_file(file);
  DocumentReader reader(document, destination.path);
  if(!reader.source_path().empty()) {
    logger_->info("Importing nodes exported from {}", reader.source_path());
  }
  auto store = open_store(destination);
  auto replicator = make_replicator(policy);
  return report(replicator.replicate(reader, *store, destination.path));
}

int TreeTool::run_serve() {
  auto store = std::make_shared<MemoryStore>("memory");
  const std::filesystem::path snapshot = settings_->get<std::string>("snapshot");
  if(!snapshot.empty() && std::filesystem::exists(snapshot)) {
    store->load_snapshot(snapshot);
    logger_->info("Loaded {} nodes from {}", store->size(), snapshot.string());
  }

  StoreServer server(store,
                     settings_->get<std::string>("listen_ip"),
                     static_cast<uint16_t>(settings_->get<int>("listen_port")),
                     logger_);
  server.start();
  server.stop_on_signals();
  server.run();

  if(!snapshot.empty()) {
    store->save_snapshot(snapshot);
    logger_->info("Saved {} nodes to {}", store->size(), snapshot.string());
  }
  return kExitOk;
}
