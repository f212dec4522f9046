#include "memory_store.hpp"

#include <algorithm>
#include <chrono>

#include "serializer.hpp"
#include "tree_walker.hpp"
#include "utils.hpp"

MemoryStore::MemoryStore(std::string name) : name_(std::move(name)) {
  clear_locked();
}

int64_t MemoryStore::now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void MemoryStore::clear_locked() {
  nodes_.clear();
  nodes_["/"] = Node{};
}

MemoryStore::Node& MemoryStore::require(const std::string& path) {
  auto it = nodes_.find(path);
  if(it == nodes_.end()) {
    throw StoreError(StoreErrorCode::NoNode, path, "node does not exist");
  }
  return it->second;
}

bool MemoryStore::exists(const std::string& path) {
  std::lock_guard lg(m_);
  return nodes_.count(path) > 0;
}

NodeData MemoryStore::get(const std::string& path) {
  std::lock_guard lg(m_);
  const auto& node = require(path);
  return NodeData{node.data, node.stat};
}

std::vector<std::string> MemoryStore::children(const std::string& path) {
  std::lock_guard lg(m_);
  return require(path).children;
}

void MemoryStore::insert_locked(const std::string& path, const std::string& data) {
  if(path == "/" || path.empty() || path.front() != '/' || path.back() == '/') {
    throw StoreError(StoreErrorCode::BadArguments, path, "invalid path");
  }
  if(nodes_.count(path)) {
    throw StoreError(StoreErrorCode::NodeExists, path, "node already exists");
  }
  auto parent_it = nodes_.find(parent_node_path(path));
  if(parent_it == nodes_.end()) {
    throw StoreError(StoreErrorCode::NoNode, path, "parent node does not exist");
  }

  const int64_t zxid = ++last_zxid_;
  const int64_t now = now_ms();
  Node node;
  node.data = data;
  node.stat.czxid = zxid;
  node.stat.mzxid = zxid;
  node.stat.pzxid = zxid;
  node.stat.ctime = now;
  node.stat.mtime = now;
  node.stat.data_length = static_cast<int32_t>(data.size());

  auto& parent = parent_it->second;
  parent.children.push_back(node_base_name(path));
  parent.stat.cversion++;
  parent.stat.pzxid = zxid;
  parent.stat.num_children = static_cast<int32_t>(parent.children.size());
  nodes_.emplace(path, std::move(node));
  ++writes_;
}

void MemoryStore::create(const std::string& path, const std::string& data) {
  std::lock_guard lg(m_);
  insert_locked(path, data);
}

void MemoryStore::set_data(const std::string& path, const std::string& data) {
  std::lock_guard lg(m_);
  auto& node = require(path);
  node.data = data;
  node.stat.version++;
  node.stat.mzxid = ++last_zxid_;
  node.stat.mtime = now_ms();
  node.stat.data_length = static_cast<int32_t>(data.size());
  ++writes_;
}

std::size_t MemoryStore::size() const {
  std::lock_guard lg(m_);
  return nodes_.size();
}

uint64_t MemoryStore::write_count() const {
  std::lock_guard lg(m_);
  return writes_;
}

void MemoryStore::put(const std::string& path, const std::string& data) {
  const std::string target = normalize_node_path(path);
  std::lock_guard lg(m_);
  std::string prefix;
  std::size_t pos = 1;
  while(pos <= target.size()) {
    auto next = target.find('/', pos);
    if(next == std::string::npos) next = target.size();
    prefix = target.substr(0, next);
    if(!nodes_.count(prefix)) {
      insert_locked(prefix, prefix == target ? data : std::string());
    } else if(prefix == target) {
      auto& node = nodes_.at(prefix);
      node.data = data;
      node.stat.version++;
      node.stat.mzxid = ++last_zxid_;
      node.stat.data_length = static_cast<int32_t>(data.size());
      ++writes_;
    }
    pos = next + 1;
  }
}

void MemoryStore::remove(const std::string& path) {
  std::lock_guard lg(m_);
  if(path == "/") {
    clear_locked();
    return;
  }
  require(path);
  for(auto it = nodes_.begin(); it != nodes_.end();) {
    if(is_same_or_descendant(it->first, path)) {
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
  auto& parent = require(parent_node_path(path));
  auto name = node_base_name(path);
  parent.children.erase(std::remove(parent.children.begin(), parent.children.end(), name),
                        parent.children.end());
  parent.stat.num_children = static_cast<int32_t>(parent.children.size());
}

void MemoryStore::load_snapshot(const std::filesystem::path& path) {
  auto document = read_document_file(path);
  DocumentReader reader(document, "/");

  std::lock_guard lg(m_);
  clear_locked();
  last_zxid_ = 0;
  // Inserting a child bumps its parent's stat, so recorded stats are
  // applied once the whole tree exists.
  std::vector<std::pair<std::string, NodeStat>> recorded;
  while(auto record = reader.next()) {
    if(record->path == "/") {
      nodes_.at("/").data = record->data;
    } else {
      insert_locked(record->path, record->data);
    }
    recorded.emplace_back(record->path, record->stat);
  }
  for(auto& [node_path, stat] : recorded) {
    auto& node = nodes_.at(node_path);
    node.stat = stat;
    node.stat.data_length = static_cast<int32_t>(node.data.size());
    node.stat.num_children = static_cast<int32_t>(node.children.size());
    last_zxid_ = std::max({last_zxid_, stat.czxid, stat.mzxid, stat.pzxid});
  }
  writes_ = 0;
}

void MemoryStore::save_snapshot(const std::filesystem::path& path) {
  // TreeWalker locks per call, so walk without holding m_.
  TreeWalker walker(*this, "/");
  write_document_file(path, to_document(walker));
}
