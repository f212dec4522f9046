#include "store_server.hpp"

#include <csignal>
#include <deque>
#include <istream>

#include "protocol.hpp"

namespace {

class StoreSession : public std::enable_shared_from_this<StoreSession> {
public:
  StoreSession(asio::ip::tcp::socket socket,
               std::shared_ptr<TreeStore> store,
               std::shared_ptr<Logger> logger)
    : socket_(std::move(socket)),
      store_(std::move(store)),
      logger_(std::move(logger)) {}

  void start() { do_read(); }

private:
  void do_read() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n',
      [this, self](std::error_code ec, std::size_t) {
        if(ec) {
          if(ec != asio::error::eof) {
            log_debug(logger_.get(), "Session read error: {}", ec.message());
          }
          close();
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        if(!line.empty()) {
          handle_line(line);
        }
        do_read();
      });
  }

  void handle_line(const std::string& line) {
    json reply;
    try {
      auto request = json::parse(line);
      reply = handle_store_request(*store_, request);
    } catch(const json::exception& e) {
      log_warn(logger_.get(), "Failed to parse request: {}  raw: {}", e.what(), line);
      reply = make_error_reply(0, StoreErrorCode::BadArguments, "unparsable request");
    }
    async_send_json(reply);
  }

  void async_send_json(const json& j) {
    bool start_write = write_queue_.empty();
    write_queue_.push_back(j.dump() + "\n");
    if(start_write) {
      do_write();
    }
  }

  void do_write() {
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
      [this, self](std::error_code ec, std::size_t) {
        if(ec) {
          log_debug(logger_.get(), "Session write error: {}", ec.message());
          close();
          return;
        }
        write_queue_.pop_front();
        do_write();
      });
  }

  void close() {
    std::error_code ec;
    socket_.close(ec);
  }

  asio::ip::tcp::socket socket_;
  std::shared_ptr<TreeStore> store_;
  std::shared_ptr<Logger> logger_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;
};

} // namespace

StoreServer::StoreServer(std::shared_ptr<TreeStore> store,
                         std::string listen_ip,
                         uint16_t listen_port,
                         std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    listen_ip_(std::move(listen_ip)),
    listen_port_(listen_port),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("store-server")) {}

StoreServer::~StoreServer() {
  stop();
}

void StoreServer::start() {
  if(started_) return;

  asio::ip::address address;
  try {
    address = asio::ip::make_address(listen_ip_);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();
  started_ = true;

  logger_->info("Serving {} on {}:{}", store_->describe(), listen_ip_, listen_port_);
  start_accept();
}

void StoreServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket) {
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else {
        logger_->debug("Accepted connection from {}", socket.remote_endpoint(ec).address().to_string());
        std::make_shared<StoreSession>(std::move(socket), store_, logger_)->start();
      }
      if(started_ && acceptor_ && acceptor_->is_open()) {
        start_accept();
      }
    });
}

void StoreServer::stop_on_signals() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number) {
    if(ec) return;
    logger_->info("Received signal {}, shutting down", signal_number);
    shutdown_io();
  });
}

void StoreServer::shutdown_io() {
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  io_.stop();
}

void StoreServer::run() {
  if(!started_) start();
  io_.run();
}

void StoreServer::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this]() {
    io_.run();
  });
}

void StoreServer::stop() {
  if(!started_) return;
  started_ = false;
  asio::post(io_, [this]() { shutdown_io(); });
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  acceptor_.reset();
  signals_.reset();
  io_.restart();
}
