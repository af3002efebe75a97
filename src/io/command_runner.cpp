#include "io/command_runner.hpp"

#include "io/fd.hpp"
#include "io/process.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace adbpipe {

Result RunCommand(const std::vector<std::string>& argv, CommandOutput& out) {
    out = CommandOutput{};

    Fd out_read;
    Fd out_write;
    Fd err_read;
    Fd err_write;
    if (auto r = Fd::Pipe(out_read, out_write); !r.is_ok())
        return Result::Fail(kErrLaunch, r.message());
    if (auto r = Fd::Pipe(err_read, err_write); !r.is_ok())
        return Result::Fail(kErrLaunch, r.message());

    SpawnIo io;
    io.stdout_fd = out_write.Get();
    io.stderr_fd = err_write.Get();

    pid_t pid = -1;
    if (auto r = SpawnProcess(argv, io, pid); !r.is_ok())
        return r;

    out_write.Close();
    err_write.Close();

    std::array<pollfd, 2> pfds{};
    pfds[0].fd = out_read.Get();
    pfds[0].events = POLLIN;
    pfds[1].fd = err_read.Get();
    pfds[1].events = POLLIN;
    std::array<std::string*, 2> sinks{&out.out, &out.err};

    int open_streams = 2;
    std::array<char, 4096> chunk{};
    while (open_streams > 0) {
        const int pr = ::poll(pfds.data(), pfds.size(), -1);
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            LogWarn("poll failed while reading %s output", argv.front().c_str());
            break;
        }
        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0)
                continue;
            const ssize_t n = ::read(pfds[i].fd, chunk.data(), chunk.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0) {
                pfds[i].fd = -1;
                --open_streams;
                continue;
            }
            sinks[i]->append(chunk.data(), static_cast<size_t>(n));
        }
    }

    out.exit_code = WaitForExit(pid);
    LogDebug("%s exited with %d", argv.front().c_str(), out.exit_code);
    return Result::Ok();
}

} // namespace adbpipe
