#pragma once
#include <cstddef>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// ZNode path helpers. Paths are absolute, '/'-separated, root is "/".
std::string normalize_node_path(const std::string& path);
std::string join_node_path(const std::string& base, const std::string& child);
std::string parent_node_path(const std::string& path);
std::string node_base_name(const std::string& path);
bool is_same_or_descendant(const std::string& path, const std::string& ancestor);
// Number of segments path lies below root (0 for root itself).
std::size_t relative_depth(const std::string& path, const std::string& root);
// Maps path under from_root to the same relative position under to_root.
std::string rebase_node_path(const std::string& path,
                             const std::string& from_root,
                             const std::string& to_root);
bool is_valid_child_name(const std::string& name);

// Base64 transport encoding for ZNode payloads. decode throws
// std::invalid_argument when the text is not canonical base64.
std::string encode_node_data(const std::string& bytes);
std::string decode_node_data(const std::string& text);
