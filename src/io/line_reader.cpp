#include "io/line_reader.hpp"

#include <cerrno>

#include <poll.h>
#include <unistd.h>

namespace loanrecon {

bool StreamLineReader::next_line(std::string& line) {
    return static_cast<bool>(std::getline(in_, line));
}

FdLineReader::FdLineReader(int fd, const std::atomic<bool>& shutdown_requested,
                           const Logger& logger, size_t max_line_bytes,
                           int poll_timeout_ms)
    : fd_(fd), shutdown_requested_(shutdown_requested), logger_(logger),
      max_line_bytes_(max_line_bytes), poll_timeout_ms_(poll_timeout_ms) {}

bool FdLineReader::next_line(std::string& line) {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            if (discarding_) {
                // Tail of an oversized line
                buffer_.erase(0, nl + 1);
                discarding_ = false;
                continue;
            }
            if (nl > max_line_bytes_) {
                logger_.error("Dropping input line of %zu bytes (limit %zu)",
                              nl, max_line_bytes_);
                buffer_.erase(0, nl + 1);
                continue;
            }
            line.assign(buffer_, 0, nl);
            buffer_.erase(0, nl + 1);
            return true;
        }

        if (buffer_.size() > max_line_bytes_) {
            if (!discarding_) {
                logger_.error("Dropping input line longer than %zu bytes",
                              max_line_bytes_);
                discarding_ = true;
            }
            buffer_.clear();
        }

        if (eof_) {
            if (discarding_) {
                buffer_.clear();
                return false;
            }
            // Final line without a terminating newline
            if (buffer_.empty()) return false;
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }

        if (shutdown_requested_.load(std::memory_order_acquire)) return false;

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, poll_timeout_ms_);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ret == 0) continue; // timeout

        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return false;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

} // namespace loanrecon
