#pragma once

#include <optional>
#include <string>

#include "node_record.hpp"

// Pull-based pre-order sequence of NodeRecord. next() returns std::nullopt
// once exhausted. A TreeError of kind NodeVanished thrown by next() concerns
// that node only; the source stays usable and the caller may keep pulling.
class NodeSource {
public:
  virtual ~NodeSource() = default;

  virtual std::optional<NodeRecord> next() = 0;
  virtual const std::string& root_path() const = 0;
};
