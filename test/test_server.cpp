#include "test_util.hpp"
#include "core/config.hpp"
#include "io/line_reader.hpp"
#include "loanreconserver/server.hpp"
#include "protocol/json_codec.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace loanrecon;

static std::string g_test_dir;

static const char* kHeader =
    "LoanID,BorrowerName,Servicer_LoanAmount,FNMA_LoanAmount,DifferenceAmount,ReconciledStatus\n";

static const char* kThreeLoans =
    "LN-001,John Smith,250000.00,250000.00,0.00,Reconciled\n"
    "LN-002,Jane Doe,300000.00,294000.00,6000.00,Unreconciled\n"
    "LN-003,Acme Holdings,150000.00,150250.00,-250.00,Pending\n";

static const char* kStatsRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_statistics","arguments":{}}})";

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::trunc);
    f << content;
}

static std::string read_sink(std::FILE* f) {
    std::string out;
    std::fflush(f);
    std::rewind(f);
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

static ServerConfig make_config(const std::string& path, std::FILE* sink = stderr) {
    ServerConfig config;
    config.data_path = path;
    config.num_threads = 2;
    config.reload_poll_ms = 10;
    config.log_level = Logger::kError;
    config.log_sink = sink;
    return config;
}

// Yields one line per step; a step may act on the server before returning.
class ScriptedLineReader : public LineReader {
public:
    using Step = std::function<bool(std::string&)>;

    explicit ScriptedLineReader(std::vector<Step> steps) : steps_(std::move(steps)) {}

    bool next_line(std::string& line) override {
        calls_++;
        if (pos_ >= steps_.size()) return false;
        return steps_[pos_++](line);
    }

    size_t calls() const { return calls_; }

private:
    std::vector<Step> steps_;
    size_t pos_ = 0;
    size_t calls_ = 0;
};

// Poll until the watcher has finished `n` reloads; false after 5 s.
static bool wait_for_reloads(const Server& server, unsigned n) {
    for (int i = 0; i < 500; i++) {
        if (server.reloads_handled() >= n) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

static std::vector<Json::Value> parse_lines(const std::string& text) {
    std::vector<Json::Value> responses;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        Json::Value v;
        std::string err;
        CHECK(parse_json(line, v, err));
        responses.push_back(v);
    }
    return responses;
}

static Json::Value tool_payload(const Json::Value& response) {
    Json::Value payload;
    std::string err;
    const Json::Value& content = response["result"]["content"];
    if (!content.isArray() || content.size() != 1) return payload;
    CHECK(parse_json(content[0]["text"].asString(), payload, err));
    return payload;
}

static void test_unreadable_path() {
    std::fprintf(stderr, "-- test_unreadable_path\n");

    Server server(make_config(g_test_dir + "/missing/loans.csv"));
    ScriptedLineReader reader({});
    std::ostringstream out;
    CHECK_EQ(server.run(reader, out), 1);

    // Nothing was served
    CHECK_EQ(reader.calls(), 0u);
    CHECK(out.str().empty());
    CHECK(!server.store().snapshot()->loaded());
}

static void test_serves_until_end_of_input() {
    std::fprintf(stderr, "-- test_serves_until_end_of_input\n");

    std::string path = g_test_dir + "/serve.csv";
    write_file(path, std::string(kHeader) + kThreeLoans);

    Server server(make_config(path));
    std::istringstream in(std::string(kStatsRequest) + "\n" +
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"query_loans","arguments":{"query":"show mismatches"}}})" "\n");
    StreamLineReader reader(in);
    std::ostringstream out;
    CHECK_EQ(server.run(reader, out), 0);
    CHECK(server.shutdown_flag().load());

    auto responses = parse_lines(out.str());
    CHECK_EQ(responses.size(), 2u);
    if (responses.size() != 2) return;

    Json::Value stats = tool_payload(responses[0]);
    CHECK_EQ(stats["totalRecords"].asInt(), 3);
    CHECK_EQ(stats["snapshotVersion"].asInt(), 1);

    Json::Value query = tool_payload(responses[1]);
    CHECK(query["success"].asBool());
    CHECK_EQ(query["totalCount"].asInt(), 2);
}

static void test_reload_publishes_new_snapshot() {
    std::fprintf(stderr, "-- test_reload_publishes_new_snapshot\n");

    std::string path = g_test_dir + "/reload.csv";
    write_file(path, std::string(kHeader) + kThreeLoans);

    Server server(make_config(path));
    bool reloaded = false;
    ScriptedLineReader reader({
        [&](std::string& line) {
            write_file(path, std::string(kHeader) + kThreeLoans +
                       "LN-004,Mary Johnson,420000.00,412500.00,7500.00,Unreconciled\n");
            server.request_reload();
            reloaded = wait_for_reloads(server, 1);
            line = kStatsRequest;
            return true;
        },
    });
    std::ostringstream out;
    CHECK_EQ(server.run(reader, out), 0);
    CHECK(reloaded);

    auto responses = parse_lines(out.str());
    CHECK_EQ(responses.size(), 1u);
    if (responses.empty()) return;
    Json::Value stats = tool_payload(responses[0]);
    CHECK_EQ(stats["totalRecords"].asInt(), 4);
    CHECK_EQ(stats["snapshotVersion"].asInt(), 2);
    CHECK_EQ(server.store().version(), 2u);
}

static void test_failed_reload_keeps_snapshot() {
    std::fprintf(stderr, "-- test_failed_reload_keeps_snapshot\n");

    std::FILE* sink = std::tmpfile();
    CHECK(sink != nullptr);
    if (!sink) return;

    std::string path = g_test_dir + "/truncated.csv";
    write_file(path, std::string(kHeader) + kThreeLoans);

    Server server(make_config(path, sink));
    bool header_only = false;
    bool empty_file = false;
    ScriptedLineReader reader({
        [&](std::string& line) {
            write_file(path, kHeader);
            server.request_reload();
            header_only = wait_for_reloads(server, 1);
            line = kStatsRequest;
            return true;
        },
        [&](std::string& line) {
            write_file(path, "");
            server.request_reload();
            empty_file = wait_for_reloads(server, 2);
            line = kStatsRequest;
            return true;
        },
    });
    std::ostringstream out;
    CHECK_EQ(server.run(reader, out), 0);
    CHECK(header_only);
    CHECK(empty_file);

    auto responses = parse_lines(out.str());
    CHECK_EQ(responses.size(), 2u);
    for (const auto& r : responses) {
        Json::Value stats = tool_payload(r);
        CHECK_EQ(stats["totalRecords"].asInt(), 3);
        CHECK_EQ(stats["snapshotVersion"].asInt(), 1);
    }
    CHECK_EQ(server.store().version(), 1u);
    CHECK_EQ(server.store().count(), 3u);

    std::string logged = read_sink(sink);
    CHECK(logged.find("Reload failed, keeping snapshot v1") != std::string::npos);
    std::fclose(sink);
}

static void test_load_skips_bad_rows() {
    std::fprintf(stderr, "-- test_load_skips_bad_rows\n");

    std::FILE* sink = std::tmpfile();
    CHECK(sink != nullptr);
    if (!sink) return;

    std::string path = g_test_dir + "/partial.csv";
    write_file(path, std::string(kHeader) + kThreeLoans +
               "LN-005,Bad Row,not-a-number,100.00,0.00,Pending\n");

    ServerConfig config = make_config(path, sink);
    config.log_level = Logger::kInfo;
    Server server(config);
    CHECK(server.load_data());
    CHECK_EQ(server.store().count(), 3u);
    CHECK_EQ(server.store().version(), 1u);

    std::string logged = read_sink(sink);
    CHECK(logged.find("Skipping line 5") != std::string::npos);
    CHECK(logged.find("Loaded 3 records") != std::string::npos);
    CHECK(logged.find("(1 rows skipped)") != std::string::npos);
    std::fclose(sink);
}

static void test_reader_exception_stops_watcher() {
    std::fprintf(stderr, "-- test_reader_exception_stops_watcher\n");

    std::string path = g_test_dir + "/throwing.csv";
    write_file(path, std::string(kHeader) + kThreeLoans);

    Server server(make_config(path));
    ScriptedLineReader reader({
        [](std::string&) -> bool { throw std::runtime_error("input failed"); },
    });
    std::ostringstream out;
    bool caught = false;
    try {
        server.run(reader, out);
    } catch (const std::runtime_error& e) {
        caught = true;
        CHECK_STR_EQ(e.what(), "input failed");
    }
    CHECK(caught);
    CHECK(server.shutdown_flag().load());
}

int main() {
    g_test_dir = "/tmp/loanrecon_server_test";
    std::filesystem::create_directories(g_test_dir);

    test_unreadable_path();
    test_serves_until_end_of_input();
    test_reload_publishes_new_snapshot();
    test_failed_reload_keeps_snapshot();
    test_load_skips_bad_rows();
    test_reader_exception_stops_watcher();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
