#include "printer.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "errors.hpp"
#include "utils.hpp"

namespace {

std::string format_timestamp(int64_t ms) {
  if(ms <= 0) return "-";
  std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
  return oss.str();
}

} // namespace

bool looks_like_text(const std::string& data) {
  std::size_t i = 0;
  while(i < data.size()) {
    unsigned char c = static_cast<unsigned char>(data[i]);
    if(c < 0x80) {
      if(c < 0x20 && c != '\n' && c != '\r' && c != '\t') return false;
      if(c == 0x7f) return false;
      ++i;
      continue;
    }
    std::size_t extra = 0;
    if((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
    else if((c & 0xF0) == 0xE0) extra = 2;
    else if((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
    else return false;
    if(i + extra >= data.size()) return false;
    for(std::size_t k = 1; k <= extra; ++k) {
      if((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) return false;
    }
    i += extra + 1;
  }
  return true;
}

Printer::Printer() : Printer(Options{}) {}

Printer::Printer(Options options) : options_(options) {}

std::string Printer::format_stat(const NodeStat& stat) {
  std::ostringstream oss;
  oss << "czxid=" << stat.czxid
      << " mzxid=" << stat.mzxid
      << " pzxid=" << stat.pzxid
      << " ctime=" << format_timestamp(stat.ctime)
      << " mtime=" << format_timestamp(stat.mtime)
      << " version=" << stat.version
      << " cversion=" << stat.cversion
      << " aversion=" << stat.aversion
      << " ephemeral=" << (stat.ephemeral() ? "yes" : "no");
  if(stat.ephemeral()) {
    oss << " owner=0x" << std::hex << stat.ephemeral_owner << std::dec;
  }
  oss << " dataLength=" << stat.data_length
      << " numChildren=" << stat.num_children;
  return oss.str();
}

std::string Printer::format_data(const std::string& data) const {
  if(data.empty()) return "(empty)";
  if(!looks_like_text(data)) {
    return "<binary, " + std::to_string(data.size()) + " bytes, sha256 " +
           sha256_hex(data).substr(0, 16) + ">";
  }
  const std::size_t limit = options_.data_display_limit;
  if(limit == 0 || data.size() <= limit) return data;
  // Back off to a UTF-8 boundary so the cut stays valid text.
  std::size_t cut = limit;
  while(cut > 0 && (static_cast<unsigned char>(data[cut]) & 0xC0) == 0x80) --cut;
  return data.substr(0, cut) + "... (+" + std::to_string(data.size() - cut) + " bytes)";
}

std::string Printer::format_node(const NodeRecord& record, std::size_t depth) const {
  const std::string pad(depth * options_.indent_width, ' ');
  const std::string detail_pad = pad + std::string(options_.indent_width, ' ');
  std::ostringstream oss;
  oss << pad << record.path << "\n"
      << detail_pad << "stat: " << format_stat(record.stat) << "\n"
      << detail_pad << "data: " << format_data(record.data);
  return oss.str();
}

std::string Printer::format_vanished(const std::string& path, std::size_t depth) const {
  return std::string(depth * options_.indent_width, ' ') + path + " (vanished)";
}

std::size_t Printer::stream(NodeSource& source,
                            const std::function<void(const std::string&)>& sink) const {
  std::size_t printed = 0;
  for(;;) {
    std::optional<NodeRecord> record;
    try {
      record = source.next();
    } catch(const TreeError& e) {
      if(e.kind() != ErrorKind::NodeVanished) throw;
      sink(format_vanished(e.path(), relative_depth(e.path(), source.root_path())));
      continue;
    }
    if(!record) break;
    sink(format_node(*record, relative_depth(record->path, source.root_path())));
    ++printed;
  }
  return printed;
}

std::string Printer::render(NodeSource& source) const {
  std::string out;
  stream(source, [&](const std::string& block) {
    out += block;
    out += "\n";
  });
  return out;
}
