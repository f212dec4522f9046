#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Server-assigned node metadata. Captured for display and export only;
// writes never carry it, the destination assigns its own.
struct NodeStat {
  int64_t czxid = 0;
  int64_t mzxid = 0;
  int64_t pzxid = 0;
  int64_t ctime = 0;            // ms since epoch
  int64_t mtime = 0;            // ms since epoch
  int32_t version = 0;
  int32_t cversion = 0;
  int32_t aversion = 0;
  int64_t ephemeral_owner = 0;  // session id, 0 for persistent nodes
  int32_t data_length = 0;
  int32_t num_children = 0;

  bool ephemeral() const { return ephemeral_owner != 0; }
  bool operator==(const NodeStat& other) const;
};

void to_json(nlohmann::json& j, const NodeStat& stat);
void from_json(const nlohmann::json& j, NodeStat& stat);

// Payload plus metadata as returned by TreeStore::get.
struct NodeData {
  std::string data;
  NodeStat stat;
};

// One node of a tree at the moment it was read.
struct NodeRecord {
  std::string path;
  std::string data;
  NodeStat stat;
  std::vector<std::string> children;  // direct child names, sorted

  std::string name() const;
};

// Same path, payload and child order; metadata is informational.
bool same_content(const NodeRecord& a, const NodeRecord& b);
