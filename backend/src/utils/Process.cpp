#include "Process.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <csignal>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace {

// Owns one pipe end; closes it on scope exit.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

void makePipe(Fd& readEnd, Fd& writeEnd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe2");
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
}

void ignoreSigpipe() {
    // A child that exits without reading stdin must not kill us on write()
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

Process::Process(std::vector<std::string> argv)
    : argv_(std::move(argv))
{
    if (argv_.empty())
        throw std::invalid_argument("Process: empty argv");
}

Process::~Process() = default;

ProcessResult Process::run(const std::string& input) {
    ignoreSigpipe();

    Fd inRead, inWrite, outRead, outWrite, errRead, errWrite;
    makePipe(inRead, inWrite);
    makePipe(outRead, outWrite);
    makePipe(errRead, errWrite);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, inRead.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outWrite.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errWrite.get(), STDERR_FILENO);

    std::vector<char*> cargv;
    cargv.reserve(argv_.size() + 1);
    for (auto& a : argv_) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, cargv[0], &actions, nullptr, cargv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        spdlog::debug("Failed to spawn '{}': {}", argv_[0], std::strerror(rc));
        throw std::system_error(rc, std::generic_category(), "spawn " + argv_[0]);
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        pid_ = pid;
        if (terminated_) ::kill(pid_, SIGTERM);
    }
    spdlog::debug("Spawned '{}' (pid {})", argv_[0], pid);

    inRead.reset();
    outWrite.reset();
    errWrite.reset();

    size_t written = 0;
    if (input.empty()) {
        inWrite.reset();
    }
    else {
        ::fcntl(inWrite.get(), F_SETFL, ::fcntl(inWrite.get(), F_GETFL) | O_NONBLOCK);
    }

    ProcessResult result;
    char buf[4096];

    while (outRead.get() >= 0 || errRead.get() >= 0) {
        pollfd fds[3];
        nfds_t n = 0;
        int outIdx = -1, errIdx = -1, inIdx = -1;
        if (outRead.get() >= 0) { outIdx = n; fds[n++] = {outRead.get(), POLLIN, 0}; }
        if (errRead.get() >= 0) { errIdx = n; fds[n++] = {errRead.get(), POLLIN, 0}; }
        if (inWrite.get() >= 0) { inIdx = n; fds[n++] = {inWrite.get(), POLLOUT, 0}; }

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        if (inIdx >= 0 && fds[inIdx].revents) {
            ssize_t w = ::write(inWrite.get(), input.data() + written, input.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            if (w < 0 && errno != EAGAIN && errno != EINTR) {
                inWrite.reset();  // EPIPE: the child does not read stdin
            }
            else if (written == input.size()) {
                inWrite.reset();
            }
        }

        auto drain = [&](int idx, Fd& fd, std::string& sink) {
            if (idx < 0 || !fds[idx].revents) return;
            ssize_t r = ::read(fd.get(), buf, sizeof(buf));
            if (r > 0) sink.append(buf, static_cast<size_t>(r));
            else if (r == 0 || (errno != EINTR && errno != EAGAIN)) fd.reset();
        };
        drain(outIdx, outRead, result.out);
        drain(errIdx, errRead, result.err);
    }
    inWrite.reset();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::lock_guard<std::mutex> lock(mtx_);
            pid_ = -1;
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        pid_ = -1;
    }

    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    spdlog::debug("'{}' exited with {}", argv_[0], result.exitCode);
    return result;
}

void Process::terminate() {
    std::lock_guard<std::mutex> lock(mtx_);
    terminated_ = true;
    if (pid_ > 0) {
        spdlog::debug("Terminating '{}' (pid {})", argv_[0], pid_);
        ::kill(pid_, SIGTERM);
    }
}

ProcessResult runProcess(const std::vector<std::string>& argv, const std::string& input) {
    Process p(argv);
    return p.run(input);
}
