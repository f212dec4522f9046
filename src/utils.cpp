#include "utils.hpp"
#include <openssl/sha.h>
#include "base64.h"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string normalize_node_path(const std::string& path){
    if(path.empty() || path.front() != '/'){
        throw std::invalid_argument("ZNode path must be absolute: '" + path + "'");
    }
    std::string out;
    out.reserve(path.size());
    for(char c : path){
        if(c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while(out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string join_node_path(const std::string& base, const std::string& child){
    if(child.empty()) return base;
    if(base.empty() || base == "/") return "/" + child;
    return base + "/" + child;
}

std::string parent_node_path(const std::string& path){
    if(path == "/" || path.empty()) return "";
    auto pos = path.rfind('/');
    if(pos == 0 || pos == std::string::npos) return "/";
    return path.substr(0, pos);
}

std::string node_base_name(const std::string& path){
    auto pos = path.rfind('/');
    if(pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

bool is_same_or_descendant(const std::string& path, const std::string& ancestor){
    if(path == ancestor) return true;
    if(ancestor == "/") return !path.empty() && path.front() == '/';
    return path.size() > ancestor.size() &&
           path.compare(0, ancestor.size(), ancestor) == 0 &&
           path[ancestor.size()] == '/';
}

std::size_t relative_depth(const std::string& path, const std::string& root){
    if(path == root) return 0;
    std::size_t start = (root == "/") ? 0 : root.size();
    std::size_t depth = 0;
    for(std::size_t i = start; i < path.size(); ++i){
        if(path[i] == '/') ++depth;
    }
    return depth;
}

std::string rebase_node_path(const std::string& path,
                             const std::string& from_root,
                             const std::string& to_root){
    if(!is_same_or_descendant(path, from_root)){
        throw std::invalid_argument("'" + path + "' is not under '" + from_root + "'");
    }
    std::string suffix = (from_root == "/") ? path.substr(1) : path.substr(from_root.size());
    if(!suffix.empty() && suffix.front() == '/') suffix.erase(suffix.begin());
    return join_node_path(to_root, suffix);
}

bool is_valid_child_name(const std::string& name){
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos;
}

std::string encode_node_data(const std::string& bytes){
    return base64_encode(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::string decode_node_data(const std::string& text){
    if(text.size() % 4 != 0){
        throw std::invalid_argument("base64 length is not a multiple of 4");
    }
    for(std::size_t i = 0; i < text.size(); ++i){
        unsigned char c = static_cast<unsigned char>(text[i]);
        bool alphabet = std::isalnum(c) || c == '+' || c == '/';
        bool padding = (c == '=') && i + 2 >= text.size();
        if(!alphabet && !padding){
            throw std::invalid_argument("invalid base64 character at offset " + std::to_string(i));
        }
    }
    if(text.size() >= 2 && text[text.size() - 2] == '=' && text.back() != '='){
        throw std::invalid_argument("misplaced base64 padding");
    }
    try {
        return base64_decode(text);
    } catch(const std::exception& e){
        throw std::invalid_argument(std::string("base64 decode failed: ") + e.what());
    }
}
