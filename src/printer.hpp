#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "node_source.hpp"

// Human-readable listing of a node stream, indented by depth below the
// stream root.
class Printer {
public:
  struct Options {
    // Longest text payload shown verbatim; 0 shows everything.
    std::size_t data_display_limit = 256;
    std::size_t indent_width = 2;
  };

  Printer();
  explicit Printer(Options options);

  std::string format_node(const NodeRecord& record, std::size_t depth) const;
  std::string format_vanished(const std::string& path, std::size_t depth) const;
  std::string format_data(const std::string& data) const;
  static std::string format_stat(const NodeStat& stat);

  // Pulls source to the end, handing each formatted block to sink as soon
  // as it is produced. Returns the number of nodes printed.
  std::size_t stream(NodeSource& source, const std::function<void(const std::string&)>& sink) const;
  std::string render(NodeSource& source) const;

private:
  Options options_;
};

bool looks_like_text(const std::string& data);
