#pragma once

#include <string>

namespace adbpipe {

// Incremental line splitter over a blocking or non-blocking descriptor.
// Lines end at '\n' or '\r'; a trailing partial line is returned at EOF.
class LineReader {
  public:
    enum class Status {
        Line,
        Timeout,
        Eof,
        Error,
    };

    explicit LineReader(int fd);

    // timeout_ms < 0 waits indefinitely.
    Status Next(std::string& line, int timeout_ms);

    int LastError() const { return last_error_; }

  private:
    bool PopLine(std::string& line);

    int fd_;
    std::string buffer_;
    bool eof_ = false;
    int last_error_ = 0;
};

} // namespace adbpipe
