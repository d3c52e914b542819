#pragma once

#include <atomic>
#include <istream>
#include <string>

#include "core/config.hpp"
#include "util/logger.hpp"

namespace loanrecon {

// Source of newline-delimited input for the session loop.
class LineReader {
public:
    virtual ~LineReader() = default;

    // Read the next line without its '\n' (a trailing '\r' is kept).
    // Returns false at end of input, on read error, or after shutdown.
    virtual bool next_line(std::string& line) = 0;
};

// Lines from a std::istream.
class StreamLineReader : public LineReader {
public:
    explicit StreamLineReader(std::istream& in) : in_(in) {}

    bool next_line(std::string& line) override;

private:
    std::istream& in_;
};

// Lines from a file descriptor (normally stdin).
// Waits with poll() in short slices so that a shutdown request is noticed
// while the peer is idle, whichever thread received the signal.
// Lines longer than max_line_bytes are dropped with an error log; the
// buffer never holds more than max_line_bytes plus one read chunk.
class FdLineReader : public LineReader {
public:
    FdLineReader(int fd, const std::atomic<bool>& shutdown_requested,
                 const Logger& logger,
                 size_t max_line_bytes = MAX_LINE_BYTES,
                 int poll_timeout_ms = 500);

    bool next_line(std::string& line) override;

private:
    int fd_;
    const std::atomic<bool>& shutdown_requested_;
    const Logger& logger_;
    size_t max_line_bytes_;
    int poll_timeout_ms_;
    std::string buffer_;
    bool eof_ = false;
    bool discarding_ = false;  // inside an oversized line, skip to next '\n'
};

} // namespace loanrecon
