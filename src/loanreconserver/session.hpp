#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include <json/json.h>

#include "io/line_reader.hpp"
#include "protocol/messages.hpp"
#include "query/query_executor.hpp"
#include "util/logger.hpp"

namespace loanrecon {

// One client session over a line-delimited JSON-RPC stream.
// Strictly alternating: each request line gets exactly one response line,
// written and flushed before the next line is read. A request that fails to
// parse or whose handler throws becomes an error response; the session
// keeps going.
class Session {
public:
    Session(const QueryExecutor& executor, const Logger& logger);

    // Handle one request line and return the response line (no newline).
    // Does not throw for malformed input or failing handlers.
    std::string handle_line(const std::string& line) const;

    // Dispatch a parsed request. Handler failures propagate as exceptions.
    RpcResponse dispatch(const RpcRequest& req) const;

    // Serve lines until end of input, shutdown, or an output failure.
    // Blank lines are skipped without a response.
    // Returns the number of responses written.
    size_t run(LineReader& reader, std::ostream& out) const;

private:
    const QueryExecutor& executor_;
    const Logger& logger_;

    Json::Value handle_initialize() const;
    Json::Value handle_tools_list() const;
    Json::Value handle_tools_call(const Json::Value& params) const;
};

} // namespace loanrecon
