#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace courtops::core::process {

// One-shot child process: feeds a payload on stdin, collects stdout until the
// child exits. The child's stderr is inherited.
class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool Start(const std::string& command,
               const std::vector<std::string>& args,
               const std::string& working_dir,
               std::string input,
               std::string* error);
    // Returns true once the child has exited and its output is drained.
    bool WaitForExit(int timeout_ms);
    // Kills the child's whole process group.
    bool Kill();
    bool IsRunning() const;
    int ExitCode() const;
    std::string Output() const;
    int pid() const { return pid_; }

private:
    void WriterLoop(std::string input);
    void ReaderLoop();
    void JoinThreads();

    std::atomic<bool> running_{false};
    bool exited_ = false;
    int exit_code_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int pid_ = -1;

    std::thread writer_thread_;
    std::thread reader_thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string output_;
};

}  // namespace courtops::core::process
