#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tree_store.hpp"

// In-process TreeStore. Assigns zxids and timestamps the way an ensemble
// would; child lists keep creation order, not sorted order.
class MemoryStore : public TreeStore {
public:
  explicit MemoryStore(std::string name = "memory");

  bool exists(const std::string& path) override;
  NodeData get(const std::string& path) override;
  std::vector<std::string> children(const std::string& path) override;
  void create(const std::string& path, const std::string& data) override;
  void set_data(const std::string& path, const std::string& data) override;
  std::string describe() const override { return name_; }

  std::size_t size() const;
  // Creates path and any missing ancestors with empty data; existing
  // nodes on the way keep their data. The last node gets data.
  void put(const std::string& path, const std::string& data);
  void remove(const std::string& path);
  uint64_t write_count() const;

  // Snapshots use the export document format rooted at "/" and keep the
  // recorded metadata.
  void load_snapshot(const std::filesystem::path& path);
  void save_snapshot(const std::filesystem::path& path);

private:
  struct Node {
    std::string data;
    NodeStat stat;
    std::vector<std::string> children;
  };

  Node& require(const std::string& path);
  void insert_locked(const std::string& path, const std::string& data);
  void clear_locked();
  static int64_t now_ms();

  std::string name_;
  mutable std::mutex m_;
  std::unordered_map<std::string, Node> nodes_;
  int64_t last_zxid_ = 0;
  uint64_t writes_ = 0;
};
