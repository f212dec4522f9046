#include "tree_store.hpp"

#include <stdexcept>

#include "utils.hpp"

StoreAddress parse_store_address(const std::string& text) {
  auto slash = text.find('/');
  if(slash == std::string::npos) {
    throw std::invalid_argument("Invalid store address '" + text + "': expected host:port/path");
  }
  std::string endpoint = text.substr(0, slash);
  auto colon = endpoint.rfind(':');
  if(colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
    throw std::invalid_argument("Invalid store address '" + text + "': missing host or port");
  }

  StoreAddress address;
  address.host = endpoint.substr(0, colon);
  int port = 0;
  try {
    std::size_t consumed = 0;
    port = std::stoi(endpoint.substr(colon + 1), &consumed);
    if(consumed != endpoint.size() - colon - 1) throw std::invalid_argument("trailing characters");
  } catch(const std::exception&) {
    throw std::invalid_argument("Invalid port in store address '" + text + "'");
  }
  if(port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in store address '" + text + "'");
  }
  address.port = static_cast<unsigned short>(port);
  address.path = normalize_node_path(text.substr(slash));
  return address;
}
