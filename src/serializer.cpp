#include "serializer.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

using json = nlohmann::json;

json make_document_entry(const NodeRecord& record) {
  json entry;
  entry["name"] = record.name();
  entry["data"] = encode_node_data(record.data);
  entry["stat"] = record.stat;
  entry["children"] = json::array();
  return entry;
}

void DocumentBuilder::add(const NodeRecord& record) {
  if(count_ == 0) {
    root_path_ = record.path;
    open_.push_back(OpenEntry{record.path, 0, make_document_entry(record)});
    ++count_;
    return;
  }

  if(record.path == root_path_ || !is_same_or_descendant(record.path, root_path_)) {
    throw TreeError(ErrorKind::MalformedSequence, record.path,
                    "node is outside the subtree rooted at " + root_path_);
  }
  const std::size_t depth = relative_depth(record.path, root_path_);
  while(!open_.empty() && open_.back().depth >= depth) {
    close_top();
  }
  const std::string parent = parent_node_path(record.path);
  if(open_.empty() || open_.back().path != parent) {
    throw TreeError(ErrorKind::MalformedSequence, record.path,
                    "parent " + parent + " was not the most recent node at depth " +
                    std::to_string(depth - 1));
  }
  if(!open_.back().child_names.insert(record.name()).second) {
    throw TreeError(ErrorKind::MalformedSequence, record.path,
                    "node was already added under " + parent);
  }
  open_.push_back(OpenEntry{record.path, depth, make_document_entry(record)});
  ++count_;
}

void DocumentBuilder::close_top() {
  OpenEntry top = std::move(open_.back());
  open_.pop_back();
  if(open_.empty()) {
    root_entry_ = std::move(top.entry);
  } else {
    open_.back().entry["children"].push_back(std::move(top.entry));
  }
}

json DocumentBuilder::finish() {
  while(!open_.empty()) {
    close_top();
  }
  if(!root_entry_) {
    throw TreeError(ErrorKind::MalformedSequence, "", "no nodes to serialize");
  }
  json document;
  document["format"] = kDocumentFormat;
  document["version"] = kDocumentVersion;
  document["source_path"] = root_path_;
  document["root"] = std::move(*root_entry_);
  root_entry_.reset();
  return document;
}

json to_document(NodeSource& source, Logger* logger) {
  DocumentBuilder builder;
  for(;;) {
    std::optional<NodeRecord> record;
    try {
      record = source.next();
    } catch(const TreeError& e) {
      if(e.kind() != ErrorKind::NodeVanished) throw;
      log_warn(logger, "Skipping {}: {}", e.path(), e.what());
      continue;
    }
    if(!record) break;
    builder.add(*record);
  }
  log_debug(logger, "Serialized {} nodes under {}", builder.size(), source.root_path());
  return builder.finish();
}

DocumentReader::DocumentReader(const json& document, const std::string& root_path)
  : document_(document),
    root_path_(normalize_node_path(root_path)) {
  validate();
  source_path_ = document_.value("source_path", "");
  stack_.push_back(Frame{&document_.at("root"), root_path_});
}

void DocumentReader::validate() const {
  auto malformed = [](const std::string& where, const std::string& why) {
    return TreeError(ErrorKind::MalformedDocument, where, why);
  };

  if(!document_.is_object()) {
    throw malformed("", "document is not a JSON object");
  }
  if(document_.contains("format") &&
     (!document_["format"].is_string() || document_["format"].get<std::string>() != kDocumentFormat)) {
    throw malformed("", "unknown document format");
  }
  if(document_.contains("version") &&
     (!document_["version"].is_number_integer() || document_["version"].get<int>() > kDocumentVersion)) {
    throw malformed("", "unsupported document version");
  }
  if(document_.contains("source_path") && !document_["source_path"].is_string()) {
    throw malformed("", "source_path is not a string");
  }
  if(!document_.contains("root") || !document_["root"].is_object()) {
    throw malformed("", "missing root entry");
  }

  std::vector<Frame> pending{Frame{&document_.at("root"), root_path_}};
  while(!pending.empty()) {
    Frame frame = std::move(pending.back());
    pending.pop_back();
    const json& entry = *frame.entry;

    if(!entry.is_object()) throw malformed(frame.path, "entry is not an object");
    if(!entry.contains("name") || !entry["name"].is_string()) {
      throw malformed(frame.path, "entry has no name");
    }
    if(!entry.contains("data") || !entry["data"].is_string()) {
      throw malformed(frame.path, "entry has no data");
    }
    try {
      decode_node_data(entry["data"].get<std::string>());
    } catch(const std::invalid_argument& e) {
      throw malformed(frame.path, std::string("undecodable data: ") + e.what());
    }
    if(entry.contains("stat")) {
      if(!entry["stat"].is_object()) {
        throw malformed(frame.path, "stat is not an object");
      }
      try {
        entry["stat"].get<NodeStat>();
      } catch(const json::exception& e) {
        throw malformed(frame.path, std::string("bad stat: ") + e.what());
      }
    }
    if(!entry.contains("children")) continue;
    if(!entry["children"].is_array()) {
      throw malformed(frame.path, "children is not an array");
    }

    std::set<std::string> seen;
    for(const auto& child : entry["children"]) {
      if(!child.is_object() || !child.contains("name") || !child["name"].is_string()) {
        throw malformed(frame.path, "child entry has no name");
      }
      auto name = child["name"].get<std::string>();
      if(!is_valid_child_name(name)) {
        throw malformed(frame.path, "invalid child name '" + name + "'");
      }
      if(!seen.insert(name).second) {
        throw malformed(frame.path, "duplicate child name '" + name + "'");
      }
      pending.push_back(Frame{&child, join_node_path(frame.path, name)});
    }
  }
}

std::optional<NodeRecord> DocumentReader::next() {
  if(stack_.empty()) return std::nullopt;

  Frame frame = std::move(stack_.back());
  stack_.pop_back();
  const json& entry = *frame.entry;

  NodeRecord record;
  record.path = frame.path;
  record.data = decode_node_data(entry.at("data").get<std::string>());
  if(entry.contains("stat")) {
    record.stat = entry.at("stat").get<NodeStat>();
  }
  if(entry.contains("children")) {
    const auto& children = entry.at("children");
    record.children.reserve(children.size());
    for(const auto& child : children) {
      record.children.push_back(child.at("name").get<std::string>());
    }
    for(auto it = children.rbegin(); it != children.rend(); ++it) {
      stack_.push_back(Frame{&*it, join_node_path(frame.path, it->at("name").get<std::string>())});
    }
  }
  return record;
}

std::vector<NodeRecord> from_document(const json& document, const std::string& root_path) {
  DocumentReader reader(document, root_path);
  std::vector<NodeRecord> out;
  while(auto record = reader.next()) {
    out.push_back(std::move(*record));
  }
  return out;
}

void write_document_file(const std::filesystem::path& path, const json& document) {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    throw std::runtime_error("Unable to write " + path.string());
  }
  out << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
  if(!out) {
    throw std::runtime_error("Write to " + path.string() + " failed");
  }
}

json read_document_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw std::runtime_error("Unable to read " + path.string());
  }
  try {
    json document;
    in >> document;
    return document;
  } catch(const json::exception& e) {
    throw TreeError(ErrorKind::MalformedDocument, "", path.string() + ": " + e.what());
  }
}
