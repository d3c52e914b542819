#include "protocol/json_codec.hpp"

#include "core/amount.hpp"
#include "util/string_utils.hpp"

#include <memory>

namespace loanrecon {

std::string write_json_line(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["precision"] = 15;
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

bool parse_json(const std::string& text, Json::Value& root, std::string& error_msg) {
    Json::CharReaderBuilder reader_builder;
    reader_builder["collectComments"] = false;
    reader_builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());

    std::string parse_errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
        error_msg = "Invalid JSON: " + trim(parse_errors);
        return false;
    }
    return true;
}

static Json::Value amount_json(Amount a) {
    return Json::Value(amount_to_double(a));
}

Json::Value to_json(const LoanRecord& rec) {
    Json::Value obj(Json::objectValue);
    obj["loanId"] = rec.loan_id;
    obj["borrowerName"] = rec.borrower_name;
    obj["servicerLoanAmount"] = amount_json(rec.servicer_amount);
    obj["fnmaLoanAmount"] = amount_json(rec.fnma_amount);
    obj["differenceAmount"] = amount_json(rec.difference_amount);
    obj["reconciledStatus"] = rec.reconciled_status;
    obj["hasMismatch"] = rec.has_mismatch();
    return obj;
}

Json::Value to_json(const QueryStatistics& stats) {
    Json::Value obj(Json::objectValue);
    if (stats.empty()) return obj;

    obj["TotalAmount_Servicer"] = amount_json(stats.total_servicer);
    obj["TotalAmount_FNMA"] = amount_json(stats.total_fnma);
    obj["TotalDifference"] = amount_json(stats.total_difference);
    obj["AverageDifference"] = stats.average_difference;
    obj["MaxDifference"] = amount_json(stats.max_difference);
    obj["MinDifference"] = amount_json(stats.min_difference);
    obj["MismatchCount"] = static_cast<Json::UInt64>(stats.mismatch_count);
    return obj;
}

Json::Value to_json(const QueryResult& result) {
    Json::Value obj(Json::objectValue);
    obj["success"] = result.success;
    obj["message"] = result.message;

    Json::Value data(Json::arrayValue);
    for (const auto& rec : result.data) {
        data.append(to_json(rec));
    }
    obj["data"] = std::move(data);
    obj["totalCount"] = static_cast<Json::UInt64>(result.total_count);

    Json::Value meta(Json::objectValue);
    meta["queryType"] = result.metadata.query_type;
    meta["executionTimeMs"] = static_cast<Json::Int64>(result.metadata.execution_time_ms);
    meta["statistics"] = to_json(result.metadata.statistics);
    obj["metadata"] = std::move(meta);
    return obj;
}

Json::Value to_json(const DatasetStatistics& stats) {
    Json::Value obj(Json::objectValue);
    obj["totalRecords"] = static_cast<Json::UInt64>(stats.total_records);
    if (stats.last_load_time) {
        obj["lastLoadTime"] = format_utc_timestamp(*stats.last_load_time);
    } else {
        obj["lastLoadTime"] = Json::Value();
    }
    obj["dataLoaded"] = stats.data_loaded;
    obj["mismatchCount"] = static_cast<Json::UInt64>(stats.mismatch_count);
    obj["snapshotVersion"] = static_cast<Json::UInt64>(stats.snapshot_version);
    return obj;
}

Json::Value to_json(const RpcResponse& resp) {
    Json::Value obj(Json::objectValue);
    obj["jsonrpc"] = "2.0";
    obj["id"] = resp.id;
    if (resp.error) {
        Json::Value err(Json::objectValue);
        err["code"] = resp.error->code;
        err["message"] = resp.error->message;
        obj["error"] = std::move(err);
    } else {
        obj["result"] = resp.result ? *resp.result : Json::Value(Json::objectValue);
    }
    return obj;
}

bool parse_rpc_request(const Json::Value& root, RpcRequest& req, std::string& error_msg) {
    if (!root.isObject()) {
        error_msg = "Request must be a JSON object";
        return false;
    }

    // Keep the id even when the rest is malformed so errors can echo it
    req.id = root.get("id", Json::Value());

    const Json::Value& method = root["method"];
    if (!method.isString()) {
        error_msg = "Request is missing a string 'method'";
        return false;
    }
    req.method = method.asString();

    const Json::Value& params = root["params"];
    if (!params.isNull() && !params.isObject()) {
        error_msg = "'params' must be an object";
        return false;
    }
    req.params = params;
    return true;
}

static bool parse_optional_int(const Json::Value& args, const char* key,
                               std::optional<int>& out, std::string& error_msg) {
    const Json::Value& v = args[key];
    if (v.isNull()) {
        out.reset();
        return true;
    }
    if (!v.isInt()) {
        error_msg = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = v.asInt();
    return true;
}

bool parse_query_request(const Json::Value& args, QueryRequest& req, std::string& error_msg) {
    if (!args.isObject()) {
        error_msg = "query_loans arguments must be an object";
        return false;
    }

    const Json::Value& query = args["query"];
    if (!query.isString()) {
        error_msg = "query_loans requires a string 'query' argument";
        return false;
    }
    req.query = query.asString();

    return parse_optional_int(args, "limit", req.limit, error_msg) &&
           parse_optional_int(args, "skip", req.skip, error_msg);
}

Json::Value make_text_content(const std::string& text) {
    Json::Value item(Json::objectValue);
    item["type"] = "text";
    item["text"] = text;

    Json::Value content(Json::arrayValue);
    content.append(std::move(item));

    Json::Value result(Json::objectValue);
    result["content"] = std::move(content);
    return result;
}

} // namespace loanrecon
