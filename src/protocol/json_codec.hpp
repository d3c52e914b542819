#pragma once

#include <string>

#include <json/json.h>

#include "core/types.hpp"
#include "protocol/messages.hpp"

namespace loanrecon {

// Serialize to a compact single-line JSON string (no trailing newline).
std::string write_json_line(const Json::Value& value);

// Parse JSON text. Returns false and sets error_msg on malformed input.
bool parse_json(const std::string& text, Json::Value& root, std::string& error_msg);

// Domain structures -> JSON (camelCase keys)
Json::Value to_json(const LoanRecord& rec);
Json::Value to_json(const QueryStatistics& stats);
Json::Value to_json(const QueryResult& result);
Json::Value to_json(const DatasetStatistics& stats);
Json::Value to_json(const RpcResponse& resp);

// JSON -> request structures.
// Return false and set error_msg when a required member is missing or has
// the wrong type.
bool parse_rpc_request(const Json::Value& root, RpcRequest& req, std::string& error_msg);
bool parse_query_request(const Json::Value& args, QueryRequest& req, std::string& error_msg);

// MCP tool result: {"content":[{"type":"text","text":<text>}]}
Json::Value make_text_content(const std::string& text);

} // namespace loanrecon
