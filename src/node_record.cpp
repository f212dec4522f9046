#include "node_record.hpp"

#include "utils.hpp"

bool NodeStat::operator==(const NodeStat& other) const {
  return czxid == other.czxid && mzxid == other.mzxid && pzxid == other.pzxid &&
         ctime == other.ctime && mtime == other.mtime &&
         version == other.version && cversion == other.cversion &&
         aversion == other.aversion && ephemeral_owner == other.ephemeral_owner &&
         data_length == other.data_length && num_children == other.num_children;
}

void to_json(nlohmann::json& j, const NodeStat& stat) {
  j = nlohmann::json{
    {"czxid", stat.czxid},
    {"mzxid", stat.mzxid},
    {"pzxid", stat.pzxid},
    {"ctime", stat.ctime},
    {"mtime", stat.mtime},
    {"version", stat.version},
    {"cversion", stat.cversion},
    {"aversion", stat.aversion},
    {"ephemeralOwner", stat.ephemeral_owner},
    {"dataLength", stat.data_length},
    {"numChildren", stat.num_children}
  };
}

// Missing fields keep their defaults; older exports carry fewer of them.
void from_json(const nlohmann::json& j, NodeStat& stat) {
  stat.czxid = j.value("czxid", int64_t{0});
  stat.mzxid = j.value("mzxid", int64_t{0});
  stat.pzxid = j.value("pzxid", int64_t{0});
  stat.ctime = j.value("ctime", int64_t{0});
  stat.mtime = j.value("mtime", int64_t{0});
  stat.version = j.value("version", 0);
  stat.cversion = j.value("cversion", 0);
  stat.aversion = j.value("aversion", 0);
  stat.ephemeral_owner = j.value("ephemeralOwner", int64_t{0});
  stat.data_length = j.value("dataLength", 0);
  stat.num_children = j.value("numChildren", 0);
}

std::string NodeRecord::name() const {
  return node_base_name(path);
}

bool same_content(const NodeRecord& a, const NodeRecord& b) {
  return a.path == b.path && a.data == b.data && a.children == b.children;
}
