#include "io/process.hpp"

#include "io/fd.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string_view>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace adbpipe {

namespace {

bool IsExecutableFile(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

[[noreturn]] void ChildFail(int status_fd, int err) {
    ssize_t n;
    do {
        n = ::write(status_fd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    ::_exit(127);
}

} // namespace

Result SpawnProcess(const std::vector<std::string>& argv, const SpawnIo& io, pid_t& out_pid) {
    out_pid = -1;
    if (argv.empty() || argv.front().empty())
        return Result::Fail(kErrLaunch, "empty command");

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    Fd dev_null(::open("/dev/null", O_RDWR | O_CLOEXEC));
    if (!dev_null.Valid()) {
        const int err = errno;
        return Result::Fail(kErrLaunch, "cannot open /dev/null: " + std::string(std::strerror(err)));
    }

    Fd status_read;
    Fd status_write;
    if (auto r = Fd::Pipe(status_read, status_write); !r.is_ok())
        return Result::Fail(kErrLaunch, r.message());

    const int in_fd = io.stdin_fd >= 0 ? io.stdin_fd : dev_null.Get();
    const int out_fd = io.stdout_fd >= 0 ? io.stdout_fd : dev_null.Get();
    const int err_fd = io.stderr_fd >= 0 ? io.stderr_fd : dev_null.Get();

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        return Result::Fail(kErrLaunch, "fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        // An ignored SIGPIPE survives exec; stages must die quietly when
        // their reader goes away.
        (void)::signal(SIGPIPE, SIG_DFL);
        if (io.new_process_group)
            (void)::setpgid(0, 0);
        if (::dup2(in_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0 ||
            ::dup2(err_fd, STDERR_FILENO) < 0) {
            ChildFail(status_write.Get(), errno);
        }
        ::execvp(cargv[0], cargv.data());
        ChildFail(status_write.Get(), errno);
    }

    if (io.new_process_group)
        (void)::setpgid(pid, pid);

    status_write.Close();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_read.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)WaitForExit(pid);
        return Result::Fail(kErrLaunch,
                            "cannot execute " + argv.front() + ": " + std::strerror(child_errno));
    }

    out_pid = pid;
    return Result::Ok();
}

int WaitForExit(pid_t pid) {
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

bool IsExecutableOnPath(const std::string& tool) {
    if (tool.empty())
        return false;
    if (tool.find('/') != std::string::npos)
        return IsExecutableFile(tool);

    const char* path_env = std::getenv("PATH");
    std::string_view path = path_env ? path_env : "/usr/bin:/bin";
    while (true) {
        const auto sep = path.find(':');
        std::string dir(path.substr(0, sep));
        if (dir.empty())
            dir = ".";
        if (IsExecutableFile(dir + "/" + tool))
            return true;
        if (sep == std::string_view::npos)
            break;
        path.remove_prefix(sep + 1);
    }
    return false;
}

} // namespace adbpipe
