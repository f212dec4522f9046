#pragma once

#include <asio.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "tree_store.hpp"

// Blocking TreeStore client for a StoreServer. Socket errors surface as
// StoreError(ConnectionLoss) and drop the connection; the next call
// reconnects. The connection is closed on destruction.
class RemoteStore : public TreeStore {
public:
  explicit RemoteStore(StoreAddress address, std::shared_ptr<Logger> logger = nullptr);
  ~RemoteStore() override;

  RemoteStore(const RemoteStore&) = delete;
  RemoteStore& operator=(const RemoteStore&) = delete;

  void connect();
  void close();
  bool connected() const { return connected_; }

  bool exists(const std::string& path) override;
  NodeData get(const std::string& path) override;
  std::vector<std::string> children(const std::string& path) override;
  void create(const std::string& path, const std::string& data) override;
  void set_data(const std::string& path, const std::string& data) override;
  std::string describe() const override { return address_.endpoint(); }

private:
  nlohmann::json call(const nlohmann::json& request, const std::string& path);

  StoreAddress address_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::streambuf read_buf_;
  uint64_t next_id_ = 1;
  bool connected_ = false;
};
