#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

struct ProcessResult {
    int exitCode = -1;      // -1 if the child was killed by a signal
    std::string out;
    std::string err;
};

// Runs an external utility (argv[0] is looked up in PATH, no shell involved),
// feeding `input` on stdin and collecting stdout/stderr.
//
// A missing executable throws std::system_error. terminate() may be called
// from another thread while run() is blocked.
class Process {
public:
    explicit Process(std::vector<std::string> argv);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    ProcessResult run(const std::string& input = "");
    void terminate();

    const std::vector<std::string>& argv() const { return argv_; }

private:
    std::vector<std::string> argv_;

    std::mutex mtx_;
    pid_t pid_ = -1;
    bool terminated_ = false;
};

// Convenience wrapper for a one-shot call.
ProcessResult runProcess(const std::vector<std::string>& argv, const std::string& input = "");
