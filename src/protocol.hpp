#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "tree_store.hpp"

using json = nlohmann::json;

// Store wire protocol: one JSON object per line. Requests carry "type",
// "id" and "path" ("data" for create/set, base64); every reply echoes the
// id with "ok" and, on failure, an "error" code from StoreErrorCode.

json make_store_request(uint64_t id, const std::string& type, const std::string& path);
json make_store_request(uint64_t id,
                        const std::string& type,
                        const std::string& path,
                        const std::string& data);
json make_reply(uint64_t id);
json make_error_reply(uint64_t id, StoreErrorCode code, const std::string& message);

// Throws StoreError when reply reports a failure.
void check_reply(const json& reply, const std::string& path);

// Server side: executes request against store and builds the reply.
json handle_store_request(TreeStore& store, const json& request);
