#include "log.hpp"
#include "memory_store.hpp"
#include "protocol.hpp"
#include "remote_store.hpp"
#include "replicator.hpp"
#include "serializer.hpp"
#include "settings_manager.hpp"
#include "store_server.hpp"
#include "test_runner_utils.hpp"
#include "tree_tool.hpp"
#include "tree_walker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using zktree::test::Expect;

namespace {

struct TestContext {
  zktree::test::LogCapture& logs;
  bool verbose = false;
  Expect expect;
};

std::shared_ptr<Logger> make_logger(TestContext& ctx, const std::string& name) {
  auto logger = std::make_shared<Logger>(name);
  ctx.logs.attach(logger);
  return logger;
}

Replicator make_replicator(TestContext& ctx,
                           ConflictPolicy policy,
                           PromptFn prompt = PromptFn(),
                           std::size_t retries = 3) {
  Replicator::Options options;
  options.policy = policy;
  options.prompt = std::move(prompt);
  options.write_retries = retries;
  options.retry_backoff = std::chrono::milliseconds(0);
  return Replicator(std::move(options), make_logger(ctx, "replicator"));
}

ReplicationSummary copy_tree(Replicator& replicator,
                             TreeStore& source,
                             const std::string& source_root,
                             TreeStore& destination,
                             const std::string& destination_root) {
  TreeWalker walker(source, source_root);
  return replicator.replicate(walker, destination, destination_root);
}

std::string data_at(MemoryStore& store, const std::string& path) {
  return store.get(path).data;
}

// Source /a = "x" with one child b = "y".
void seed_example(MemoryStore& store) {
  store.put("/a", "x");
  store.put("/a/b", "y");
}

// /a {b {d}, c}
void seed_branching(MemoryStore& store) {
  store.put("/a", "root");
  store.put("/a/b", "b");
  store.put("/a/b/d", "d");
  store.put("/a/c", "c");
}

bool test_copy_into_empty_destination(TestContext& ctx) {
  MemoryStore source;
  MemoryStore destination;
  seed_example(source);
  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.equal(summary.written, std::size_t{2}, "written");
  ctx.expect.equal(summary.skipped, std::size_t{0}, "skipped");
  ctx.expect.that(summary.succeeded(), "succeeded");
  ctx.expect.equal(data_at(destination, "/z"), std::string("x"), "/z data");
  ctx.expect.equal(data_at(destination, "/z/b"), std::string("y"), "/z/b data");
  ctx.expect.that(!destination.exists("/z/a"), "source root name is not nested under the destination");
  return ctx.expect.ok();
}

bool test_export_import_to_new_root(TestContext& ctx) {
  MemoryStore source;
  seed_example(source);
  TreeWalker walker(source, "/a");
  auto document = to_document(walker);

  MemoryStore destination;
  DocumentReader reader(document, "/q");
  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = replicator.replicate(reader, destination, "/q");

  ctx.expect.equal(summary.written, std::size_t{2}, "written");
  ctx.expect.equal(data_at(destination, "/q"), std::string("x"), "/q data");
  ctx.expect.equal(data_at(destination, "/q/b"), std::string("y"), "/q/b data");
  return ctx.expect.ok();
}

bool test_overwrite_is_idempotent(TestContext& ctx) {
  MemoryStore source;
  MemoryStore destination;
  seed_branching(source);
  destination.put("/z/c", "stale");
  destination.put("/z/extra", "kept");

  auto replicator = make_replicator(ctx, ConflictPolicy::Overwrite);
  auto first = copy_tree(replicator, source, "/a", destination, "/z");
  TreeWalker after_first(destination, "/z");
  auto snapshot_first = zktree::test::drain(after_first);

  auto second = copy_tree(replicator, source, "/a", destination, "/z");
  TreeWalker after_second(destination, "/z");
  auto snapshot_second = zktree::test::drain(after_second);

  ctx.expect.equal(first.written, std::size_t{4}, "first run writes every node");
  ctx.expect.equal(second.written, std::size_t{4}, "second run rewrites every node");
  ctx.expect.equal(snapshot_first.size(), snapshot_second.size(), "same node count");
  for(std::size_t i = 0; i < snapshot_first.size() && i < snapshot_second.size(); ++i) {
    ctx.expect.that(same_content(snapshot_first[i], snapshot_second[i]),
                    "unchanged content at " + snapshot_first[i].path);
  }
  ctx.expect.equal(data_at(destination, "/z/c"), std::string("c"), "stale data replaced");
  ctx.expect.equal(data_at(destination, "/z/extra"), std::string("kept"), "destination-only node kept");
  return ctx.expect.ok();
}

bool test_no_clobber_keeps_existing_data(TestContext& ctx) {
  MemoryStore source;
  MemoryStore destination;
  seed_example(source);
  destination.put("/z", "old");
  const auto version_before = destination.get("/z").stat.version;

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.equal(summary.written, std::size_t{1}, "only the new child written");
  ctx.expect.equal(summary.skipped, std::size_t{1}, "existing root skipped");
  ctx.expect.equal(data_at(destination, "/z"), std::string("old"), "existing data untouched");
  ctx.expect.equal(destination.get("/z").stat.version, version_before, "existing node not rewritten");
  ctx.expect.equal(data_at(destination, "/z/b"), std::string("y"), "child created");
  return ctx.expect.ok();
}

bool test_interactive_always_skip(TestContext& ctx) {
  MemoryStore source;
  MemoryStore destination;
  seed_branching(source);
  auto seed = make_replicator(ctx, ConflictPolicy::Overwrite);
  copy_tree(seed, source, "/a", destination, "/z");
  const auto writes_before = destination.write_count();

  int prompts = 0;
  auto replicator = make_replicator(ctx, ConflictPolicy::Interactive,
                                    [&](const std::string&) { ++prompts; return PromptAnswer::Skip; });
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.equal(summary.written, std::size_t{0}, "no writes");
  ctx.expect.equal(summary.skipped, std::size_t{4}, "every node skipped");
  ctx.expect.equal(prompts, 4, "asked once per node");
  ctx.expect.equal(destination.write_count(), writes_before, "destination untouched");
  return ctx.expect.ok();
}

bool test_interactive_abort_stops_run(TestContext& ctx) {
  MemoryStore source;
  MemoryStore destination;
  seed_branching(source);
  destination.put("/z", "old-root");
  destination.put("/z/b", "old-b");
  destination.put("/z/c", "old-c");

  std::vector<std::string> asked;
  auto replicator = make_replicator(ctx, ConflictPolicy::Interactive,
    [&](const std::string& path) {
      asked.push_back(path);
      return asked.size() == 1 ? PromptAnswer::Write : PromptAnswer::AbortAll;
    });
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.that(summary.aborted, "run aborted");
  ctx.expect.that(!summary.succeeded(), "aborted run is not a success");
  ctx.expect.equal(summary.written, std::size_t{1}, "root written before the abort");
  ctx.expect.equal(zktree::test::join(asked), std::string("/z,/z/b"), "prompted paths");
  ctx.expect.equal(data_at(destination, "/z"), std::string("root"), "accepted overwrite applied");
  ctx.expect.equal(data_at(destination, "/z/b"), std::string("old-b"), "aborted node untouched");
  ctx.expect.that(!destination.exists("/z/b/d"), "nothing below the abort point written");
  ctx.expect.equal(data_at(destination, "/z/c"), std::string("old-c"), "later sibling untouched");
  return ctx.expect.ok();
}

bool test_transient_failures_are_retried(TestContext& ctx) {
  MemoryStore source;
  MemoryStore inner;
  seed_branching(source);
  zktree::test::FaultyStore destination(inner);
  destination.fail_create("/z/b", StoreErrorCode::ConnectionLoss, 2);
  destination.fail_exists("/z/c", StoreErrorCode::ConnectionLoss, 1);

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber, PromptFn(), 3);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.that(summary.succeeded(), "run succeeded after retries");
  ctx.expect.equal(summary.written, std::size_t{4}, "all nodes written");
  ctx.expect.equal(destination.create_calls(), std::size_t{6}, "two extra create attempts");
  ctx.expect.equal(data_at(inner, "/z/b"), std::string("b"), "retried node written");
  ctx.expect.that(ctx.logs.contains("Transient failure"), "retry logged");
  return ctx.expect.ok();
}

bool test_lost_create_reply_completes_write(TestContext& ctx) {
  MemoryStore source;
  MemoryStore inner;
  seed_example(source);
  zktree::test::FaultyStore destination(inner);
  destination.lose_create_reply("/z/b");

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.that(summary.succeeded(), "run succeeded");
  ctx.expect.equal(summary.written, std::size_t{2}, "node counted once");
  ctx.expect.equal(summary.skipped, std::size_t{0}, "own write not mistaken for a conflict");
  ctx.expect.equal(data_at(inner, "/z/b"), std::string("y"), "data in place");
  ctx.expect.equal(destination.set_calls(), std::size_t{1}, "write finished with a single set");
  return ctx.expect.ok();
}

bool test_partial_failure_continues(TestContext& ctx) {
  MemoryStore source;
  MemoryStore inner;
  seed_branching(source);
  zktree::test::FaultyStore destination(inner);
  destination.fail_create("/z/b", StoreErrorCode::ConnectionLoss, 10);

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber, PromptFn(), 2);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.equal(summary.failed, std::size_t{2}, "failed node and its child");
  ctx.expect.equal(summary.written, std::size_t{2}, "root and sibling written");
  ctx.expect.that(!summary.succeeded(), "partial run is not a success");
  ctx.expect.equal(data_at(inner, "/z/c"), std::string("c"), "sibling after the failure written");
  ctx.expect.equal(destination.create_calls(), std::size_t{5}, "bounded attempts, child not attempted");
  if(summary.failures.size() == 2) {
    ctx.expect.equal(summary.failures[0].path, std::string("/z/b"), "first failure path");
    ctx.expect.equal(summary.failures[1].path, std::string("/z/b/d"), "blocked child path");
    ctx.expect.that(summary.failures[0].kind == ErrorKind::WriteFailure, "failure kind");
  }
  return ctx.expect.ok();
}

bool test_denied_write_is_not_retried(TestContext& ctx) {
  MemoryStore source;
  MemoryStore inner;
  seed_example(source);
  zktree::test::FaultyStore destination(inner);
  destination.fail_create("/z/b", StoreErrorCode::Denied, 1);

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.equal(summary.failed, std::size_t{1}, "one failure");
  ctx.expect.equal(destination.create_calls(), std::size_t{2}, "single attempt for the denied node");
  ctx.expect.that(ctx.logs.contains("/z/b"), "failure logged with its path");
  return ctx.expect.ok();
}

bool test_root_failure_is_fatal(TestContext& ctx) {
  MemoryStore source;
  MemoryStore inner;
  seed_example(source);
  zktree::test::FaultyStore destination(inner);
  destination.fail_create("/z", StoreErrorCode::Denied, 1);

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  ctx.expect.throws_tree_error([&]{ copy_tree(replicator, source, "/a", destination, "/z"); },
                               ErrorKind::RootFailure, "root create denied");
  ctx.expect.that(!inner.exists("/z/b"), "no descendants written");
  return ctx.expect.ok();
}

bool test_destination_parents(TestContext& ctx) {
  MemoryStore source;
  seed_example(source);

  MemoryStore created;
  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", created, "/deep/er/z");
  ctx.expect.that(summary.succeeded(), "copy below missing parents");
  ctx.expect.equal(data_at(created, "/deep/er"), std::string(), "parent created empty");
  ctx.expect.equal(data_at(created, "/deep/er/z/b"), std::string("y"), "subtree copied");

  Replicator::Options options;
  options.create_parents = false;
  options.retry_backoff = std::chrono::milliseconds(0);
  Replicator strict(options, make_logger(ctx, "strict"));
  MemoryStore bare;
  ctx.expect.throws_tree_error([&]{ copy_tree(strict, source, "/a", bare, "/deep/z"); },
                               ErrorKind::RootFailure, "missing parent without create_parents");
  return ctx.expect.ok();
}

bool test_vanished_source_node_counted(TestContext& ctx) {
  MemoryStore inner;
  seed_branching(inner);
  zktree::test::FaultyStore source(inner);
  source.vanish_on_get("/a/b");
  MemoryStore destination;

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");

  ctx.expect.equal(summary.written, std::size_t{2}, "surviving nodes written");
  ctx.expect.equal(summary.failed, std::size_t{1}, "vanished node counted");
  if(!summary.failures.empty()) {
    ctx.expect.that(summary.failures[0].kind == ErrorKind::NodeVanished, "vanished kind");
  }
  ctx.expect.that(!destination.exists("/z/b"), "vanished node not written");
  return ctx.expect.ok();
}

bool test_vanished_source_root_is_fatal(TestContext& ctx) {
  MemoryStore source;
  MemoryStore destination;
  seed_example(source);
  TreeWalker walker(source, "/a");
  source.remove("/a");

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  ctx.expect.throws_tree_error([&]{ replicator.replicate(walker, destination, "/z"); },
                               ErrorKind::RootFailure, "root deleted before it was read");
  ctx.expect.that(!destination.exists("/z"), "nothing written");
  return ctx.expect.ok();
}

bool test_vanished_node_reported_at_destination_path(TestContext& ctx) {
  MemoryStore inner;
  seed_branching(inner);
  zktree::test::FaultyStore source(inner);
  source.vanish_on_get("/a/c");
  MemoryStore destination;

  auto replicator = make_replicator(ctx, ConflictPolicy::NoClobber);
  auto summary = copy_tree(replicator, source, "/a", destination, "/z");
  ctx.expect.equal(summary.failed, std::size_t{1}, "one vanished node");
  if(!summary.failures.empty()) {
    ctx.expect.equal(summary.failures[0].path, std::string("/z/c"), "failure path rebased");
  }
  return ctx.expect.ok();
}

TreeTool::Options memory_tool_options(std::shared_ptr<MemoryStore> store,
                                      std::vector<std::string>* output = nullptr) {
  TreeTool::Options options;
  options.store_factory = [store](const StoreAddress&) {
    return std::static_pointer_cast<TreeStore>(store);
  };
  options.prompt = [](const std::string&) { return PromptAnswer::AbortAll; };
  options.output = [output](const std::string& block) {
    if(output) output->push_back(block);
  };
  return options;
}

void configure(SettingsManager& settings, const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!settings.set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

bool test_tool_export_import_files(TestContext& ctx) {
  auto dir = zktree::test::make_workspace("zktree_replicate_runner");
  auto store = std::make_shared<MemoryStore>();
  seed_branching(*store);

  auto settings = std::make_shared<SettingsManager>();
  configure(*settings, "retry_backoff_ms", 0);
  TreeTool tool(settings, memory_tool_options(store));
  ctx.logs.attach(tool.logger());

  RunPlan export_plan;
  export_plan.action = Action::Export;
  export_plan.source = parse_store_address("memory:1/a");
  export_plan.file = dir / "export.json";
  ctx.expect.equal(tool.execute(export_plan), kExitOk, "export status");

  RunPlan import_plan;
  import_plan.action = Action::Import;
  import_plan.destination = parse_store_address("memory:1/q");
  import_plan.file = dir / "export.json";
  ctx.expect.equal(tool.execute(import_plan), kExitOk, "import status");
  ctx.expect.equal(data_at(*store, "/q/b/d"), std::string("d"), "imported grandchild");
  ctx.expect.that(tool.last_summary() && tool.last_summary()->written == 4, "import summary");

  // Importing again skips everything under the default policy.
  ctx.expect.equal(tool.execute(import_plan), kExitOk, "repeat import status");
  ctx.expect.that(tool.last_summary() && tool.last_summary()->skipped == 4, "repeat import skipped");

  zktree::test::write_text_file(dir / "broken.json", "{\"root\": {\"name\": \"a\", \"data\": \"!\"}}");
  import_plan.destination = parse_store_address("memory:1/broken");
  import_plan.file = dir / "broken.json";
  ctx.expect.equal(tool.execute(import_plan), kExitFatal, "malformed document is fatal");
  ctx.expect.that(!store->exists("/broken"), "nothing written from a malformed document");

  // A bad stat deep in the tree is caught before the first write.
  nlohmann::json bad_stat = {
    {"root", {{"name", "a"}, {"data", "eA=="},
              {"children", nlohmann::json::array({
                {{"name", "b"}, {"data", "eQ=="}, {"stat", {{"czxid", "oops"}}}}})}}}};
  zktree::test::write_text_file(dir / "bad_stat.json", bad_stat.dump());
  import_plan.destination = parse_store_address("memory:1/bad_stat");
  import_plan.file = dir / "bad_stat.json";
  ctx.expect.equal(tool.execute(import_plan), kExitFatal, "bad stat is fatal");
  ctx.expect.that(!store->exists("/bad_stat"), "nothing written from a document with a bad stat");

  RunPlan missing;
  missing.action = Action::Export;
  missing.source = parse_store_address("memory:1/nope");
  missing.file = dir / "nope.json";
  ctx.expect.equal(tool.execute(missing), kExitFatal, "missing source root is fatal");
  return ctx.expect.ok();
}

bool test_tool_exit_status(TestContext& ctx) {
  auto store = std::make_shared<MemoryStore>();
  seed_branching(*store);
  store->put("/z/b", "existing");

  auto settings = std::make_shared<SettingsManager>();
  TreeTool tool(settings, memory_tool_options(store));
  ctx.logs.attach(tool.logger());

  RunPlan plan;
  plan.action = Action::Copy;
  plan.policy = ConflictPolicy::Interactive;
  plan.source = parse_store_address("memory:1/a");
  plan.destination = parse_store_address("memory:1/z");
  ctx.expect.equal(tool.execute(plan), kExitNodeFailures, "aborted copy status");
  ctx.expect.that(tool.last_summary() && tool.last_summary()->aborted, "summary marks the abort");
  ctx.expect.equal(data_at(*store, "/z/b"), std::string("existing"), "abort kept existing data");

  std::vector<std::string> output;
  TreeTool printer(settings, memory_tool_options(store, &output));
  RunPlan print;
  print.action = Action::Print;
  print.source = parse_store_address("memory:1/a");
  ctx.expect.equal(printer.execute(print), kExitOk, "print status");
  ctx.expect.equal(output.size(), std::size_t{4}, "one block per node");
  if(!output.empty()) {
    ctx.expect.that(output[0].rfind("/a\n", 0) == 0, "listing starts at the root");
  }

  // Nodes deleted mid-walk make PRINT and EXPORT report node failures.
  auto faulty = std::make_shared<zktree::test::FaultyStore>(*store);
  std::vector<std::string> partial;
  auto vanishing = memory_tool_options(store, &partial);
  vanishing.store_factory = [faulty](const StoreAddress&) {
    return std::static_pointer_cast<TreeStore>(faulty);
  };
  TreeTool walker_tool(settings, vanishing);
  ctx.logs.attach(walker_tool.logger());

  faulty->vanish_on_get("/a/c");
  ctx.expect.equal(walker_tool.execute(print), kExitNodeFailures, "print with a vanished node");
  ctx.expect.that(!partial.empty() && partial.back().find("(vanished)") != std::string::npos,
                  "vanished node marked in the listing");
  ctx.expect.that(ctx.logs.contains("vanished during the walk"), "vanished count reported");

  RunPlan export_plan;
  export_plan.action = Action::Export;
  export_plan.source = parse_store_address("memory:1/a");
  export_plan.file = zktree::test::make_workspace("zktree_exit_status") / "partial.json";
  faulty->vanish_on_get("/a/b/d");
  ctx.expect.equal(walker_tool.execute(export_plan), kExitNodeFailures, "export with a vanished node");
  ctx.expect.that(std::filesystem::exists(export_plan.file), "partial export still written");

  ctx.expect.equal(walker_tool.execute(export_plan), kExitOk, "export of a stable tree");
  return ctx.expect.ok();
}

void expect_protocol_error(TestContext& ctx, const nlohmann::json& reply, const std::string& label) {
  try {
    check_reply(reply, "/a");
  } catch(const StoreError& e) {
    ctx.expect.that(e.code() == StoreErrorCode::ProtocolError, label + ": protocol error");
    return;
  }
  ctx.expect.that(false, label + ": no error raised");
}

bool test_malformed_replies_are_protocol_errors(TestContext& ctx) {
  expect_protocol_error(ctx, nlohmann::json::array({1, 2}), "array reply");
  expect_protocol_error(ctx, {{"type", 5}, {"ok", true}}, "numeric type");
  expect_protocol_error(ctx, {{"type", "reply"}, {"ok", "yes"}}, "string ok flag");
  expect_protocol_error(ctx, {{"type", "reply"}, {"ok", false}, {"error", 7}}, "numeric error code");

  try {
    check_reply({{"type", "reply"}, {"ok", false}, {"error", "no_node"}, {"message", "gone"}}, "/a");
    ctx.expect.that(false, "error reply raised nothing");
  } catch(const StoreError& e) {
    ctx.expect.that(e.code() == StoreErrorCode::NoNode, "well-formed error reply keeps its code");
  }
  check_reply({{"type", "reply"}, {"ok", true}}, "/a");
  return ctx.expect.ok();
}

bool test_remote_store_round_trip(TestContext& ctx) {
  auto backing = std::make_shared<MemoryStore>("served");
  seed_example(*backing);
  StoreServer server(backing, "127.0.0.1", 0, make_logger(ctx, "server"));
  server.start_background();

  StoreAddress address;
  address.host = "127.0.0.1";
  address.port = server.port();
  address.path = "/";
  RemoteStore remote(address, make_logger(ctx, "remote"));

  ctx.expect.that(remote.exists("/a"), "remote exists");
  ctx.expect.that(!remote.exists("/missing"), "remote missing");
  ctx.expect.equal(remote.get("/a/b").data, std::string("y"), "remote get");
  remote.create("/a/bin", std::string("\x00\x01", 2));
  ctx.expect.that(backing->get("/a/bin").data == std::string("\x00\x01", 2), "binary create");
  remote.set_data("/a", "x2");
  ctx.expect.equal(backing->get("/a").data, std::string("x2"), "remote set");
  ctx.expect.equal(remote.children("/a").size(), std::size_t{2}, "remote children");

  StoreErrorCode code = StoreErrorCode::ProtocolError;
  try {
    remote.create("/a/b", "dup");
  } catch(const StoreError& e) {
    code = e.code();
  }
  ctx.expect.that(code == StoreErrorCode::NodeExists, "error code carried over the wire");

  // A full copy through the CLI path, using the default remote store factory.
  auto settings = std::make_shared<SettingsManager>();
  const std::string endpoint = "127.0.0.1:" + std::to_string(server.port());
  configure(*settings, "copy", true);
  configure(*settings, "overwrite", true);
  configure(*settings, "source", endpoint + "/a");
  configure(*settings, "destination", endpoint + "/copy/of/a");
  TreeTool tool(settings);
  ctx.logs.attach(tool.logger());
  ctx.expect.equal(tool.execute(TreeTool::plan(*settings)), kExitOk, "remote copy status");
  ctx.expect.equal(backing->get("/copy/of/a/b").data, std::string("y"), "remote copy landed");

  server.stop();
  remote.close();

  code = StoreErrorCode::ProtocolError;
  try {
    remote.exists("/a");
  } catch(const StoreError& e) {
    code = e.code();
  }
  ctx.expect.that(code == StoreErrorCode::ConnectionLoss, "stopped server reports connection loss");
  return ctx.expect.ok();
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("ZKTREE_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("ZKTREE_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_echo(false);
  }
  init(verbose);
  zktree::test::LogCapture logs;
  std::vector<TestCase> tests = {
    {"copy_into_empty_destination", test_copy_into_empty_destination},
    {"export_import_to_new_root", test_export_import_to_new_root},
    {"overwrite_is_idempotent", test_overwrite_is_idempotent},
    {"no_clobber_keeps_existing_data", test_no_clobber_keeps_existing_data},
    {"interactive_always_skip", test_interactive_always_skip},
    {"interactive_abort_stops_run", test_interactive_abort_stops_run},
    {"transient_failures_are_retried", test_transient_failures_are_retried},
    {"lost_create_reply_completes_write", test_lost_create_reply_completes_write},
    {"partial_failure_continues", test_partial_failure_continues},
    {"denied_write_is_not_retried", test_denied_write_is_not_retried},
    {"root_failure_is_fatal", test_root_failure_is_fatal},
    {"destination_parents", test_destination_parents},
    {"vanished_source_node_counted", test_vanished_source_node_counted},
    {"vanished_source_root_is_fatal", test_vanished_source_root_is_fatal},
    {"vanished_node_reported_at_destination_path", test_vanished_node_reported_at_destination_path},
    {"tool_export_import_files", test_tool_export_import_files},
    {"tool_exit_status", test_tool_exit_status},
    {"malformed_replies_are_protocol_errors", test_malformed_replies_are_protocol_errors},
    {"remote_store_round_trip", test_remote_store_round_trip}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " replication tests: " << std::flush;

  for(const auto& test : tests) {
    logs.clear();
    TestContext ctx{logs, verbose, Expect{}};
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& failure : ctx.expect.failures()) {
        std::cout << "    " << failure << "\n";
      }
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_echo(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
