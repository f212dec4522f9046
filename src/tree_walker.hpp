#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "node_source.hpp"
#include "tree_store.hpp"

// Depth-first, pre-order walk of a store subtree. Children are visited in
// lexicographic order; a node is fetched only when it is about to be
// returned, so memory stays proportional to the pending frontier.
class TreeWalker : public NodeSource {
public:
  struct Options {
    // Deepest level (relative to the root) that is emitted; 0 = unlimited.
    std::size_t max_depth = 0;
  };

  // Throws TreeError(NotFound) when root_path does not exist.
  TreeWalker(TreeStore& store,
             const std::string& root_path,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);
  TreeWalker(TreeStore& store, const std::string& root_path);

  std::optional<NodeRecord> next() override;
  const std::string& root_path() const override { return root_path_; }

  std::size_t emitted() const { return emitted_; }
  // Nodes reported as NodeVanished so far.
  std::size_t vanished() const { return vanished_; }

private:
  struct Pending {
    std::string path;
    std::size_t depth = 0;
  };

  TreeStore& store_;
  std::string root_path_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::vector<Pending> stack_;
  std::size_t emitted_ = 0;
  std::size_t vanished_ = 0;
};
