#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "node_source.hpp"

inline constexpr const char* kDocumentFormat = "zktree";
inline constexpr int kDocumentVersion = 1;

// Rebuilds the nested document from a pre-order, parent-first stream.
//
// Entries of the current ancestor chain stay open on a stack; an entry is
// attached to its parent when a record at the same or a shallower depth
// arrives, so sibling order is the order in which records were added.
class DocumentBuilder {
public:
  // Throws TreeError(MalformedSequence) if the record's parent is not the
  // most recently added node one level up, the record repeats a sibling, or
  // it lies outside the subtree rooted at the first record.
  void add(const NodeRecord& record);
  // Throws TreeError(MalformedSequence) when nothing was added.
  nlohmann::json finish();

  std::size_t size() const { return count_; }

private:
  struct OpenEntry {
    std::string path;
    std::size_t depth = 0;
    nlohmann::json entry;
    std::set<std::string> child_names;
  };

  void close_top();

  std::string root_path_;
  std::vector<OpenEntry> open_;
  std::optional<nlohmann::json> root_entry_;
  std::size_t count_ = 0;
};

nlohmann::json make_document_entry(const NodeRecord& record);

// Drains source into a document. Nodes that vanish mid-walk are left out
// and reported through logger.
nlohmann::json to_document(NodeSource& source, Logger* logger = nullptr);

// Pre-order NodeSource over a nested document, re-rooted at root_path.
// The document must outlive the reader. It is validated up front: a
// malformed document throws TreeError(MalformedDocument) from the
// constructor and yields nothing.
class DocumentReader : public NodeSource {
public:
  DocumentReader(const nlohmann::json& document, const std::string& root_path);

  std::optional<NodeRecord> next() override;
  const std::string& root_path() const override { return root_path_; }

  // Path the document was exported from, empty when not recorded.
  const std::string& source_path() const { return source_path_; }

private:
  struct Frame {
    const nlohmann::json* entry = nullptr;
    std::string path;
  };

  void validate() const;

  const nlohmann::json& document_;
  std::string root_path_;
  std::string source_path_;
  std::vector<Frame> stack_;
};

std::vector<NodeRecord> from_document(const nlohmann::json& document,
                                      const std::string& root_path);

void write_document_file(const std::filesystem::path& path, const nlohmann::json& document);
// Throws TreeError(MalformedDocument) for text that is not JSON.
nlohmann::json read_document_file(const std::filesystem::path& path);
