#include "tree_walker.hpp"

#include <algorithm>

#include "errors.hpp"
#include "utils.hpp"

TreeWalker::TreeWalker(TreeStore& store,
                       const std::string& root_path,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : store_(store),
    root_path_(normalize_node_path(root_path)),
    options_(options),
    logger_(std::move(logger)) {
  if(!store_.exists(root_path_)) {
    throw TreeError(ErrorKind::NotFound, root_path_,
                    "root does not exist in " + store_.describe());
  }
  stack_.push_back(Pending{root_path_, 0});
}

TreeWalker::TreeWalker(TreeStore& store, const std::string& root_path)
  : TreeWalker(store, root_path, Options{}, nullptr) {}

std::optional<NodeRecord> TreeWalker::next() {
  if(stack_.empty()) return std::nullopt;

  Pending current = std::move(stack_.back());
  stack_.pop_back();
  log_debug(logger_.get(), "Processing ZNode located at {}", current.path);

  NodeRecord record;
  record.path = current.path;
  try {
    auto node = store_.get(current.path);
    record.data = std::move(node.data);
    record.stat = node.stat;
    record.children = store_.children(current.path);
  } catch(const StoreError& e) {
    if(e.code() != StoreErrorCode::NoNode) throw;
    ++vanished_;
    throw TreeError(ErrorKind::NodeVanished, current.path,
                    "node was deleted while the walk was in progress");
  }
  std::sort(record.children.begin(), record.children.end());

  const bool descend = options_.max_depth == 0 || current.depth < options_.max_depth;
  if(descend) {
    // Reverse push so the smallest name is popped first.
    for(auto it = record.children.rbegin(); it != record.children.rend(); ++it) {
      stack_.push_back(Pending{join_node_path(current.path, *it), current.depth + 1});
    }
  }
  ++emitted_;
  return record;
}
