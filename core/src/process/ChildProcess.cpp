#include "courtops/core/process/ChildProcess.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <mutex>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace courtops::core::process {

namespace {

std::once_flag g_ignore_sigpipe;

void ClosePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

}  // namespace

ChildProcess::ChildProcess() = default;

ChildProcess::~ChildProcess() {
    Kill();
    JoinThreads();
}

bool ChildProcess::Start(const std::string& command,
                         const std::vector<std::string>& args,
                         const std::string& working_dir,
                         std::string input,
                         std::string* error) {
    if (running_ || pid_ > 0) {
        if (error) {
            *error = "Process already started";
        }
        return false;
    }
    // A child that exits before reading its stdin must not take us down with SIGPIPE.
    std::call_once(g_ignore_sigpipe, []() { signal(SIGPIPE, SIG_IGN); });

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0) {
        if (error) {
            *error = std::string("Failed to create pipes: ") + std::strerror(errno);
        }
        ClosePipe(stdin_pipe);
        ClosePipe(stdout_pipe);
        return false;
    }
    fcntl(stdin_pipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(stdout_pipe[0], F_SETFD, FD_CLOEXEC);

    const pid_t pid = fork();
    if (pid < 0) {
        if (error) {
            *error = std::string("fork failed: ") + std::strerror(errno);
        }
        ClosePipe(stdin_pipe);
        ClosePipe(stdout_pipe);
        return false;
    }
    if (pid == 0) {
        // Own process group, so Kill() also reaches anything the command spawns.
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdin_pipe[0]);
        close(stdout_pipe[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(command.c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(126);
        }
        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    setpgid(pid, pid);
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    running_ = true;

    std::cout << "[process] Started: " << command;
    for (const auto& arg : args) {
        std::cout << ' ' << arg;
    }
    std::cout << " (PID " << pid_ << ')' << '\n';

    writer_thread_ = std::thread([this, payload = std::move(input)]() mutable { WriterLoop(std::move(payload)); });
    reader_thread_ = std::thread([this]() { ReaderLoop(); });
    return true;
}

bool ChildProcess::WaitForExit(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms < 0) {
        cv_.wait(lock, [this]() { return exited_; });
        return true;
    }
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() { return exited_; });
}

bool ChildProcess::Kill() {
    if (!running_ || pid_ <= 0) {
        return false;
    }
    // The group outlives a wrapper that already exited while its children hold stdout.
    if (kill(-pid_, SIGKILL) != 0) {
        kill(pid_, SIGKILL);
    }
    return true;
}

bool ChildProcess::IsRunning() const {
    return running_;
}

int ChildProcess::ExitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

std::string ChildProcess::Output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

void ChildProcess::WriterLoop(std::string input) {
    std::size_t offset = 0;
    while (offset < input.size()) {
        const ssize_t written = write(stdin_fd_, input.data() + offset, input.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[process] stdin write failed: " << std::strerror(errno) << '\n';
            break;
        }
        offset += static_cast<std::size_t>(written);
    }
    close(stdin_fd_);
    stdin_fd_ = -1;
}

void ChildProcess::ReaderLoop() {
    char buffer[4096];
    for (;;) {
        const ssize_t bytes_read = read(stdout_fd_, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        output_.append(buffer, buffer + bytes_read);
    }
    close(stdout_fd_);
    stdout_fd_ = -1;

    int status = 0;
    int code = -1;
    if (waitpid(pid_, &status, 0) > 0) {
        if (WIFEXITED(status)) {
            code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            code = 128 + WTERMSIG(status);
        }
    }
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_code_ = code;
        exited_ = true;
    }
    cv_.notify_all();
    std::cout << "[process] Exit code: " << code << '\n';
}

void ChildProcess::JoinThreads() {
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

}  // namespace courtops::core::process
