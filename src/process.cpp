/*
 * sweprov - Container Artifact Provisioning
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sweprov/process.hpp"
#include "sweprov/config.hpp"
#include "sweprov/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sweprov {

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

}

ProcessResult runProcess(const ProcessSpec& spec, const std::filesystem::path& outputFile) noexcept {
    ProcessResult result;

    try {
        std::string program = spec.program;
        if (program.find('/') == std::string::npos) {
            auto path = spec.env.find("PATH");
            program = findExecutable(program, path != spec.env.end() ? path->second : "/usr/bin:/bin");
            if (program.empty()) {
                result.error = "Executable not found: " + spec.program;
                return result;
            }
        }

        // Everything the child needs is prepared before fork: only
        // async-signal-safe calls are allowed between fork and exec.
        std::vector<std::string> envStrings;
        envStrings.reserve(spec.env.size());
        for (const auto& [key, value] : spec.env) {
            envStrings.push_back(key + "=" + value);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (const auto& arg : spec.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<char*> envp;
        for (auto& entry : envStrings) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        FileDescriptor output(::open(outputFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (!output.valid()) {
            result.error = errnoMessage("Cannot open log file " + outputFile.string());
            return result;
        }
        FileDescriptor devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!devnull.valid()) {
            result.error = errnoMessage("Cannot open /dev/null");
            return result;
        }

        LOG_DEBUG("Spawning: " + describeCommand(spec));

        pid_t pid = ::fork();
        if (pid < 0) {
            result.error = errnoMessage("fork failed");
            return result;
        }

        if (pid == 0) {
            // Child process
            ::dup2(devnull.get(), STDIN_FILENO);
            ::dup2(output.get(), STDOUT_FILENO);
            ::dup2(output.get(), STDERR_FILENO);
            ::execve(program.c_str(), argv.data(), envp.data());

            static const char msg[] = "execve failed\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(127);
        }

        // Parent process
        output.reset();
        devnull.reset();
        result.started = true;

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                result.error = errnoMessage("waitpid failed");
                return result;
            }
        }

        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
            result.error = "Terminated by signal " + std::to_string(result.signal);
        }
        return result;
    } catch (const std::exception& e) {
        result.error = "Failed to run " + spec.program + ": " + e.what();
        return result;
    }
}

std::string describeCommand(const ProcessSpec& spec) {
    std::string cmdline = spec.program;
    for (const auto& arg : spec.args) {
        cmdline += " " + arg;
    }
    return cmdline;
}

}
