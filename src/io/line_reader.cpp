#include "io/line_reader.hpp"

#include <array>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace adbpipe {

LineReader::LineReader(int fd) : fd_(fd) {}

bool LineReader::PopLine(std::string& line) {
    const auto pos = buffer_.find_first_of("\r\n");
    if (pos == std::string::npos)
        return false;
    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    return true;
}

LineReader::Status LineReader::Next(std::string& line, int timeout_ms) {
    while (true) {
        if (PopLine(line))
            return Status::Line;

        if (eof_) {
            if (buffer_.empty())
                return Status::Eof;
            line = std::move(buffer_);
            buffer_.clear();
            return Status::Line;
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        const int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            last_error_ = errno;
            return Status::Error;
        }
        if (pr == 0)
            return Status::Timeout;

        std::array<char, 4096> chunk{};
        const ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            last_error_ = errno;
            return Status::Error;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk.data(), static_cast<size_t>(n));
    }
}

} // namespace adbpipe
