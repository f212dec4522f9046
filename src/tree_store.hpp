#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "node_record.hpp"

// Minimal capability set of a coordination-service client. Implementations
// report failures as StoreError.
class TreeStore {
public:
  virtual ~TreeStore() = default;

  virtual bool exists(const std::string& path) = 0;
  virtual NodeData get(const std::string& path) = 0;
  // Child names in the store's native order.
  virtual std::vector<std::string> children(const std::string& path) = 0;
  // Fails with NoNode if the parent is missing, NodeExists if path is taken.
  virtual void create(const std::string& path, const std::string& data) = 0;
  // Fails with NoNode if path is missing.
  virtual void set_data(const std::string& path, const std::string& data) = 0;

  virtual std::string describe() const = 0;
};

// "host:port/path" as accepted on the command line.
struct StoreAddress {
  std::string host;
  unsigned short port = 0;
  std::string path;

  std::string endpoint() const { return host + ":" + std::to_string(port); }
};

StoreAddress parse_store_address(const std::string& text);
