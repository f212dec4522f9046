#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  NotFound,
  NodeVanished,
  MalformedSequence,
  MalformedDocument,
  ConflictAbort,
  WriteFailure,
  RootFailure
};

inline const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::NodeVanished: return "NodeVanished";
    case ErrorKind::MalformedSequence: return "MalformedSequence";
    case ErrorKind::MalformedDocument: return "MalformedDocument";
    case ErrorKind::ConflictAbort: return "ConflictAbort";
    case ErrorKind::WriteFailure: return "WriteFailure";
    case ErrorKind::RootFailure: return "RootFailure";
  }
  return "Unknown";
}

// Failure of a tree operation, tied to the node path it concerns.
class TreeError : public std::runtime_error {
public:
  TreeError(ErrorKind kind, std::string path, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + " at " +
                         (path.empty() ? std::string("<none>") : path) + ": " + message),
      kind_(kind),
      path_(std::move(path)) {}

  ErrorKind kind() const { return kind_; }
  const std::string& path() const { return path_; }

private:
  ErrorKind kind_;
  std::string path_;
};

enum class StoreErrorCode {
  NoNode,
  NodeExists,
  Denied,
  BadArguments,
  ConnectionLoss,
  ProtocolError
};

inline const char* store_error_code_name(StoreErrorCode code) {
  switch(code) {
    case StoreErrorCode::NoNode: return "no_node";
    case StoreErrorCode::NodeExists: return "node_exists";
    case StoreErrorCode::Denied: return "denied";
    case StoreErrorCode::BadArguments: return "bad_arguments";
    case StoreErrorCode::ConnectionLoss: return "connection_loss";
    case StoreErrorCode::ProtocolError: return "protocol_error";
  }
  return "unknown";
}

inline StoreErrorCode store_error_code_from_name(const std::string& name) {
  if(name == "no_node") return StoreErrorCode::NoNode;
  if(name == "node_exists") return StoreErrorCode::NodeExists;
  if(name == "denied") return StoreErrorCode::Denied;
  if(name == "bad_arguments") return StoreErrorCode::BadArguments;
  if(name == "connection_loss") return StoreErrorCode::ConnectionLoss;
  return StoreErrorCode::ProtocolError;
}

// Failure reported by a TreeStore implementation.
class StoreError : public std::runtime_error {
public:
  StoreError(StoreErrorCode code, const std::string& path, const std::string& message)
    : std::runtime_error(message + " (" + store_error_code_name(code) + ": " + path + ")"),
      code_(code),
      path_(path) {}

  StoreErrorCode code() const { return code_; }
  const std::string& path() const { return path_; }
  bool transient() const { return code_ == StoreErrorCode::ConnectionLoss; }

private:
  StoreErrorCode code_;
  std::string path_;
};
