#include "remote_store.hpp"

#include <istream>

#include "protocol.hpp"
#include "utils.hpp"

using asio::ip::tcp;

RemoteStore::RemoteStore(StoreAddress address, std::shared_ptr<Logger> logger)
  : address_(std::move(address)),
    logger_(std::move(logger)),
    socket_(io_) {}

RemoteStore::~RemoteStore() {
  close();
}

void RemoteStore::connect() {
  if(connected_) return;
  try {
    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(address_.host, std::to_string(address_.port));
    asio::connect(socket_, endpoints);
    connected_ = true;
    log_debug(logger_.get(), "Connected to store {}", address_.endpoint());
  } catch(const std::system_error& e) {
    close();
    throw StoreError(StoreErrorCode::ConnectionLoss, address_.path,
                     "cannot connect to " + address_.endpoint() + ": " + e.what());
  }
}

void RemoteStore::close() {
  std::error_code ec;
  if(socket_.is_open()) {
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
  read_buf_.consume(read_buf_.size());
  connected_ = false;
}

nlohmann::json RemoteStore::call(const nlohmann::json& request, const std::string& path) {
  connect();
  nlohmann::json reply;
  try {
    std::string line = request.dump() + "\n";
    asio::write(socket_, asio::buffer(line));
    asio::read_until(socket_, read_buf_, '\n');
    std::istream is(&read_buf_);
    std::string response;
    std::getline(is, response);
    reply = nlohmann::json::parse(response);
  } catch(const std::system_error& e) {
    close();
    throw StoreError(StoreErrorCode::ConnectionLoss, path,
                     "connection to " + address_.endpoint() + " lost: " + e.what());
  } catch(const nlohmann::json::exception& e) {
    close();
    throw StoreError(StoreErrorCode::ProtocolError, path, std::string("unparsable reply: ") + e.what());
  }

  const auto id = reply.find("id");
  if(id == reply.end() || !id->is_number_unsigned() ||
     id->get<uint64_t>() != request.at("id").get<uint64_t>()) {
    close();
    throw StoreError(StoreErrorCode::ProtocolError, path, "reply id mismatch");
  }
  check_reply(reply, path);
  return reply;
}

bool RemoteStore::exists(const std::string& path) {
  auto reply = call(make_store_request(next_id_++, "exists", path), path);
  const auto exists = reply.find("exists");
  if(exists == reply.end() || !exists->is_boolean()) {
    throw StoreError(StoreErrorCode::ProtocolError, path, "bad exists reply");
  }
  return exists->get<bool>();
}

NodeData RemoteStore::get(const std::string& path) {
  auto reply = call(make_store_request(next_id_++, "get", path), path);
  NodeData node;
  try {
    node.data = decode_node_data(reply.value("data", ""));
    if(reply.contains("stat")) node.stat = reply.at("stat").get<NodeStat>();
  } catch(const std::exception& e) {
    throw StoreError(StoreErrorCode::ProtocolError, path, std::string("bad get reply: ") + e.what());
  }
  return node;
}

std::vector<std::string> RemoteStore::children(const std::string& path) {
  auto reply = call(make_store_request(next_id_++, "children", path), path);
  try {
    return reply.value("children", std::vector<std::string>{});
  } catch(const nlohmann::json::exception& e) {
    throw StoreError(StoreErrorCode::ProtocolError, path, std::string("bad children reply: ") + e.what());
  }
}

void RemoteStore::create(const std::string& path, const std::string& data) {
  call(make_store_request(next_id_++, "create", path, data), path);
}

void RemoteStore::set_data(const std::string& path, const std::string& data) {
  call(make_store_request(next_id_++, "set", path, data), path);
}
