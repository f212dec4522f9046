#include "protocol.hpp"

#include "utils.hpp"

#include <stdexcept>

json make_store_request(uint64_t id, const std::string& type, const std::string& path) {
    json j;
    j["type"] = type;
    j["id"] = id;
    j["path"] = path;
    return j;
}

json make_store_request(uint64_t id,
                        const std::string& type,
                        const std::string& path,
                        const std::string& data) {
    json j = make_store_request(id, type, path);
    j["data"] = encode_node_data(data);
    return j;
}

json make_reply(uint64_t id) {
    json j;
    j["type"] = "reply";
    j["id"] = id;
    j["ok"] = true;
    return j;
}

json make_error_reply(uint64_t id, StoreErrorCode code, const std::string& message) {
    json j;
    j["type"] = "reply";
    j["id"] = id;
    j["ok"] = false;
    j["error"] = store_error_code_name(code);
    j["message"] = message;
    return j;
}

void check_reply(const json& reply, const std::string& path) {
    StoreErrorCode code = StoreErrorCode::ProtocolError;
    std::string message;
    try {
        if(!reply.is_object() || reply.value("type", "") != "reply") {
            throw StoreError(StoreErrorCode::ProtocolError, path, "malformed reply");
        }
        if(reply.value("ok", false)) return;
        code = store_error_code_from_name(reply.value("error", ""));
        message = reply.value("message", "request failed");
    } catch(const json::exception& e) {
        throw StoreError(StoreErrorCode::ProtocolError, path, std::string("malformed reply: ") + e.what());
    }
    throw StoreError(code, path, message);
}

json handle_store_request(TreeStore& store, const json& request) {
    uint64_t id = request.value("id", uint64_t{0});
    std::string type = request.value("type", "");
    std::string path = request.value("path", "");
    if(path.empty() || path.front() != '/') {
        return make_error_reply(id, StoreErrorCode::BadArguments, "missing or relative path");
    }

    try {
        json reply = make_reply(id);
        if(type == "exists") {
            reply["exists"] = store.exists(path);
        } else if(type == "get") {
            auto node = store.get(path);
            reply["data"] = encode_node_data(node.data);
            reply["stat"] = node.stat;
        } else if(type == "children") {
            reply["children"] = store.children(path);
        } else if(type == "create" || type == "set") {
            if(!request.contains("data") || !request["data"].is_string()) {
                return make_error_reply(id, StoreErrorCode::BadArguments, "missing data");
            }
            std::string data;
            try {
                data = decode_node_data(request["data"].get<std::string>());
            } catch(const std::invalid_argument& e) {
                return make_error_reply(id, StoreErrorCode::BadArguments, e.what());
            }
            if(type == "create") {
                store.create(path, data);
            } else {
                store.set_data(path, data);
            }
        } else {
            return make_error_reply(id, StoreErrorCode::BadArguments, "unknown request type '" + type + "'");
        }
        return reply;
    } catch(const StoreError& e) {
        return make_error_reply(id, e.code(), e.what());
    } catch(const std::invalid_argument& e) {
        return make_error_reply(id, StoreErrorCode::BadArguments, e.what());
    }
}
