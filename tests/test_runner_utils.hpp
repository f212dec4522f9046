#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "memory_store.hpp"
#include "node_source.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace zktree::test {

inline std::filesystem::path make_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

inline void write_text_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  if(out) {
    out << content;
  }
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](const LogRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back((label.empty() ? record.channel : label) + ": " + record.message);
        return false;
      });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

// MemoryStore wrapper that injects failures for chosen paths.
class FaultyStore : public TreeStore {
public:
  explicit FaultyStore(MemoryStore& inner) : inner_(inner) {}

  // The next `times` creates of path fail with code.
  void fail_create(const std::string& path, StoreErrorCode code, std::size_t times = 1) {
    create_faults_[path] = Fault{code, times};
  }
  void fail_set(const std::string& path, StoreErrorCode code, std::size_t times = 1) {
    set_faults_[path] = Fault{code, times};
  }
  void fail_exists(const std::string& path, StoreErrorCode code, std::size_t times = 1) {
    exists_faults_[path] = Fault{code, times};
  }
  // The next create of path is applied, then reported as a lost connection.
  void lose_create_reply(const std::string& path) {
    lost_replies_.insert(path);
  }
  // path (and its subtree) is deleted right before it is read.
  void vanish_on_get(const std::string& path) {
    vanishing_.insert(path);
  }

  bool exists(const std::string& path) override {
    trip(exists_faults_, path);
    return inner_.exists(path);
  }

  NodeData get(const std::string& path) override {
    if(vanishing_.erase(path) > 0) {
      inner_.remove(path);
    }
    return inner_.get(path);
  }

  std::vector<std::string> children(const std::string& path) override {
    return inner_.children(path);
  }

  void create(const std::string& path, const std::string& data) override {
    ++create_calls_;
    trip(create_faults_, path);
    inner_.create(path, data);
    if(lost_replies_.erase(path) > 0) {
      throw StoreError(StoreErrorCode::ConnectionLoss, path, "reply lost");
    }
  }

  void set_data(const std::string& path, const std::string& data) override {
    ++set_calls_;
    trip(set_faults_, path);
    inner_.set_data(path, data);
  }

  std::string describe() const override { return "faulty(" + inner_.describe() + ")"; }

  std::size_t create_calls() const { return create_calls_; }
  std::size_t set_calls() const { return set_calls_; }

private:
  struct Fault {
    StoreErrorCode code = StoreErrorCode::ConnectionLoss;
    std::size_t remaining = 0;
  };

  static void trip(std::map<std::string, Fault>& faults, const std::string& path) {
    auto it = faults.find(path);
    if(it == faults.end() || it->second.remaining == 0) return;
    it->second.remaining--;
    throw StoreError(it->second.code, path, "injected failure");
  }

  MemoryStore& inner_;
  std::map<std::string, Fault> create_faults_;
  std::map<std::string, Fault> set_faults_;
  std::map<std::string, Fault> exists_faults_;
  std::set<std::string> lost_replies_;
  std::set<std::string> vanishing_;
  std::size_t create_calls_ = 0;
  std::size_t set_calls_ = 0;
};

// Replays a fixed list of records.
class VectorSource : public NodeSource {
public:
  VectorSource(std::string root, std::vector<NodeRecord> records)
    : root_(std::move(root)), records_(std::move(records)) {}

  std::optional<NodeRecord> next() override {
    if(pos_ >= records_.size()) return std::nullopt;
    return records_[pos_++];
  }
  const std::string& root_path() const override { return root_; }

private:
  std::string root_;
  std::vector<NodeRecord> records_;
  std::size_t pos_ = 0;
};

inline NodeRecord make_record(const std::string& path,
                              const std::string& data,
                              std::vector<std::string> children = {}) {
  NodeRecord record;
  record.path = path;
  record.data = data;
  record.children = std::move(children);
  record.stat.data_length = static_cast<int32_t>(data.size());
  record.stat.num_children = static_cast<int32_t>(record.children.size());
  return record;
}

template<typename Source>
std::vector<NodeRecord> drain(Source& source) {
  std::vector<NodeRecord> out;
  while(auto record = source.next()) {
    out.push_back(std::move(*record));
  }
  return out;
}

inline std::vector<std::string> paths_of(const std::vector<NodeRecord>& records) {
  std::vector<std::string> out;
  out.reserve(records.size());
  for(const auto& record : records) out.push_back(record.path);
  return out;
}

inline std::string join(const std::vector<std::string>& items) {
  std::ostringstream oss;
  for(std::size_t i = 0; i < items.size(); ++i) {
    if(i > 0) oss << ",";
    oss << items[i];
  }
  return oss.str();
}

// Records failed expectations so a test can report all of them at once.
class Expect {
public:
  bool that(bool condition, const std::string& what) {
    if(!condition) failures_.push_back(what);
    return condition;
  }

  template<typename A, typename B>
  bool equal(const A& actual, const B& expected, const std::string& what) {
    if(actual == expected) return true;
    std::ostringstream oss;
    oss << what << ": got '" << actual << "', expected '" << expected << "'";
    failures_.push_back(oss.str());
    return false;
  }

  template<typename Fn>
  bool throws_tree_error(Fn&& fn, ErrorKind kind, const std::string& what) {
    try {
      fn();
    } catch(const TreeError& e) {
      if(e.kind() == kind) return true;
      failures_.push_back(what + ": wrong kind " + error_kind_name(e.kind()));
      return false;
    }
    failures_.push_back(what + ": nothing thrown");
    return false;
  }

  bool ok() const { return failures_.empty(); }
  const std::vector<std::string>& failures() const { return failures_; }

private:
  std::vector<std::string> failures_;
};

} // namespace zktree::test
