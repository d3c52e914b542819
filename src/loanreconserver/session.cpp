#include "loanreconserver/session.hpp"

#include "core/config.hpp"
#include "core/version.hpp"
#include "protocol/json_codec.hpp"
#include "util/string_utils.hpp"

#include <exception>
#include <stdexcept>

namespace loanrecon {

static std::string error_line(const Json::Value& id, int code, const std::string& message) {
    RpcResponse resp;
    resp.id = id;
    resp.error = RpcError{code, message};
    return write_json_line(to_json(resp));
}

static Json::Value schema_property(const char* type, const char* description) {
    Json::Value prop(Json::objectValue);
    prop["type"] = type;
    prop["description"] = description;
    return prop;
}

Session::Session(const QueryExecutor& executor, const Logger& logger)
    : executor_(executor), logger_(logger) {}

Json::Value Session::handle_initialize() const {
    Json::Value result(Json::objectValue);
    result["protocolVersion"] = MCP_PROTOCOL_VERSION;

    Json::Value info(Json::objectValue);
    info["name"] = SERVER_NAME;
    info["version"] = LOANRECON_VERSION;
    result["serverInfo"] = std::move(info);

    Json::Value caps(Json::objectValue);
    caps["tools"] = Json::Value(Json::objectValue);
    caps["resources"] = Json::Value(Json::objectValue);
    result["capabilities"] = std::move(caps);
    return result;
}

Json::Value Session::handle_tools_list() const {
    Json::Value query_tool(Json::objectValue);
    query_tool["name"] = "query_loans";
    query_tool["description"] = "Query loan data with natural language";
    {
        Json::Value schema(Json::objectValue);
        schema["type"] = "object";
        Json::Value props(Json::objectValue);
        props["query"] = schema_property("string", "Natural language query");
        props["limit"] = schema_property("integer", "Max results to return");
        props["skip"] = schema_property("integer", "Records to skip");
        schema["properties"] = std::move(props);
        Json::Value required(Json::arrayValue);
        required.append("query");
        schema["required"] = std::move(required);
        query_tool["inputSchema"] = std::move(schema);
    }

    Json::Value stats_tool(Json::objectValue);
    stats_tool["name"] = "get_statistics";
    stats_tool["description"] = "Get overall dataset statistics";
    {
        Json::Value schema(Json::objectValue);
        schema["type"] = "object";
        schema["properties"] = Json::Value(Json::objectValue);
        stats_tool["inputSchema"] = std::move(schema);
    }

    Json::Value tools(Json::arrayValue);
    tools.append(std::move(query_tool));
    tools.append(std::move(stats_tool));

    Json::Value result(Json::objectValue);
    result["tools"] = std::move(tools);
    return result;
}

Json::Value Session::handle_tools_call(const Json::Value& params) const {
    if (!params.isObject() || !params["name"].isString()) {
        throw std::invalid_argument("tools/call requires a string 'name' parameter");
    }
    std::string tool = params["name"].asString();

    if (tool == "query_loans") {
        const Json::Value& args = params["arguments"];
        QueryRequest qreq;
        std::string err;
        if (!parse_query_request(args.isNull() ? Json::Value(Json::objectValue) : args,
                                 qreq, err)) {
            throw std::invalid_argument(err);
        }
        QueryResult qres = executor_.execute(qreq);
        return make_text_content(write_json_line(to_json(qres)));
    }

    if (tool == "get_statistics") {
        DatasetStatistics ds = executor_.dataset_statistics();
        return make_text_content(write_json_line(to_json(ds)));
    }

    throw std::invalid_argument("Unknown tool: " + tool);
}

RpcResponse Session::dispatch(const RpcRequest& req) const {
    RpcResponse resp;
    resp.id = req.id;

    if (req.method == "initialize") {
        resp.result = handle_initialize();
    } else if (req.method == "ping") {
        resp.result = Json::Value(Json::objectValue);
    } else if (req.method == "tools/list") {
        resp.result = handle_tools_list();
    } else if (req.method == "tools/call") {
        resp.result = handle_tools_call(req.params);
    } else {
        resp.error = RpcError{RPC_METHOD_NOT_FOUND, "Method not found: " + req.method};
    }
    return resp;
}

std::string Session::handle_line(const std::string& line) const {
    RpcRequest req;
    try {
        Json::Value root;
        std::string err;
        if (!parse_json(line, root, err) || !parse_rpc_request(root, req, err)) {
            logger_.warn("Rejected request: %s", err.c_str());
            return error_line(req.id, RPC_INTERNAL_ERROR, err);
        }

        logger_.debug("Request %s: %s", req.method.c_str(),
                      write_json_line(req.id).c_str());
        return write_json_line(to_json(dispatch(req)));
    } catch (const std::exception& e) {
        logger_.error("Error handling %s request: %s",
                      req.method.empty() ? "malformed" : req.method.c_str(), e.what());
        return error_line(req.id, RPC_INTERNAL_ERROR, e.what());
    }
}

size_t Session::run(LineReader& reader, std::ostream& out) const {
    size_t handled = 0;
    std::string line;

    while (reader.next_line(line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty()) continue;

        out << handle_line(line) << '\n';
        out.flush();
        if (!out) {
            logger_.error("Output stream closed, ending session");
            break;
        }
        handled++;
    }

    logger_.info("Session ended after %zu request(s)", handled);
    return handled;
}

} // namespace loanrecon
