#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"
#include "tree_store.hpp"

// Serves one TreeStore to RemoteStore clients over TCP. All requests run on
// the io thread, one at a time.
class StoreServer {
public:
  StoreServer(std::shared_ptr<TreeStore> store,
              std::string listen_ip,
              uint16_t listen_port,
              std::shared_ptr<Logger> logger = nullptr);
  ~StoreServer();

  void start();
  // Blocks until stop() or, after stop_on_signals(), SIGINT/SIGTERM.
  void run();
  void start_background();
  void stop();
  void stop_on_signals();

  // Bound port; resolves listen_port 0 after start().
  uint16_t port() const { return listen_port_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void shutdown_io();

  std::shared_ptr<TreeStore> store_;
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::signal_set> signals_;
  std::atomic<bool> started_{false};
};
