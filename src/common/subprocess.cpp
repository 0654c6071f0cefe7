#include "subscout/common/subprocess.hpp"
#include "subscout/common/logger.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>

namespace subscout {
namespace common {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }

    void closeRead() { closeFd(fds[0]); }
    void closeWrite() { closeFd(fds[1]); }
    void closeBoth() { closeRead(); closeWrite(); }

    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

void writeAll(int fd, const std::string& data) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        offset += static_cast<size_t>(n);
    }
}

int waitChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}

ProcessResult runProcess(const std::vector<std::string>& argv, const std::string& input) {
    ProcessResult result;

    if (argv.empty()) {
        result.spawn_errno = EINVAL;
        return result;
    }

    Pipe in, out, err, status;
    if (!in.open() || !out.open() || !err.open() || !status.open()) {
        result.spawn_errno = errno;
        in.closeBoth(); out.closeBoth(); err.closeBoth(); status.closeBoth();
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        result.spawn_errno = errno;
        in.closeBoth(); out.closeBoth(); err.closeBoth(); status.closeBoth();
        return result;
    }

    if (pid == 0) {
        dup2(in.fds[0], STDIN_FILENO);
        dup2(out.fds[1], STDOUT_FILENO);
        dup2(err.fds[1], STDERR_FILENO);
        execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(status.fds[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    in.closeRead();
    out.closeWrite();
    err.closeWrite();
    status.closeWrite();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    status.closeRead();

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        in.closeWrite();
        out.closeRead();
        err.closeRead();
        waitChild(pid);
        result.spawn_errno = exec_errno;
        return result;
    }

    result.spawned = true;

    std::thread writer([&in, &input]() {
        writeAll(in.fds[1], input);
        in.closeWrite();
    });

    pollfd fds[2] = {
        {out.fds[0], POLLIN, 0},
        {err.fds[0], POLLIN, 0}
    };
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_streams = 2;
    char buffer[8192];

    while (open_streams > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::instance().warn("[Process] poll failed | error={}", strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t bytes = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(bytes));
            } else if (bytes == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    writer.join();
    out.closeRead();
    err.closeRead();

    result.exit_code = waitChild(pid);
    return result;
}

}}
