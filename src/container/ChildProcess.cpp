#include "../../include/crawl_archiver/container/ChildProcess.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace crawl_archiver { namespace container {

namespace {

int decodeWaitStatus(int wstatus) {
    if (WIFEXITED(wstatus)) {
        return WEXITSTATUS(wstatus);
    }
    if (WIFSIGNALED(wstatus)) {
        return 128 + WTERMSIG(wstatus);
    }
    return -1;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Runs in the forked child: only async-signal-safe calls until exec
[[noreturn]] void execChild(char* const* args, int outputWrite, int errorWrite) {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);
    ::setpgid(0, 0);

    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
    }
    ::dup2(outputWrite, STDOUT_FILENO);
    ::dup2(outputWrite, STDERR_FILENO);

    ::execvp(args[0], args);

    int err = errno;
    ssize_t ignored = ::write(errorWrite, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                  std::string& error) {
    if (argv.empty()) {
        error = "empty command";
        return nullptr;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int outputPipe[2];
    if (::pipe2(outputPipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        return nullptr;
    }
    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        ::close(outputPipe[0]);
        ::close(errorPipe[0]);
        execChild(args.data(), outputPipe[1], errorPipe[1]);
    }

    ::close(outputPipe[1]);
    ::close(errorPipe[1]);

    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(errorPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        int wstatus = 0;
        ::waitpid(pid, &wstatus, 0);
        ::close(outputPipe[0]);
        error = "cannot execute " + argv[0] + ": " + std::strerror(execErrno);
        return nullptr;
    }

    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, outputPipe[0]));
}

ChildProcess::ChildProcess(pid_t pid, int outputFd) : pid_(pid), outputFd_(outputFd) {
}

ChildProcess::~ChildProcess() {
    if (!poll()) {
        LOG_WARNING("Child process " + std::to_string(pid_) + " still running at teardown, killing it");
        kill();
        int wstatus = 0;
        ::waitpid(pid_, &wstatus, 0);
    }
    closeFd(outputFd_);
}

void ChildProcess::closeOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeFd(outputFd_);
}

std::optional<int> ChildProcess::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exitCode_) {
        return exitCode_;
    }
    int wstatus = 0;
    pid_t rc = ::waitpid(pid_, &wstatus, WNOHANG);
    if (rc == pid_) {
        exitCode_ = decodeWaitStatus(wstatus);
    } else if (rc < 0 && errno == ECHILD) {
        exitCode_ = -1;
    }
    return exitCode_;
}

std::optional<int> ChildProcess::wait(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto code = poll()) {
            return code;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

bool ChildProcess::terminate() {
    return sendSignal(SIGTERM);
}

bool ChildProcess::kill() {
    return sendSignal(SIGKILL);
}

bool ChildProcess::sendSignal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exitCode_) {
        return false;
    }
    return ::kill(pid_, sig) == 0;
}

CommandResult runCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) {
    CommandResult result;
    std::string error;
    auto child = ChildProcess::spawn(argv, error);
    if (!child) {
        result.output = error;
        return result;
    }
    result.started = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd{child->outputFd(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 200)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(child->outputFd(), buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            break;
        }
    }

    if (result.timedOut) {
        LOG_WARNING("Command timed out: " + formatCommand(argv));
        child->kill();
        child->wait(std::chrono::seconds(5));
        return result;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto code = child->wait(std::max(remaining, std::chrono::milliseconds(100)));
    if (!code) {
        result.timedOut = true;
        child->kill();
        child->wait(std::chrono::seconds(5));
        return result;
    }
    result.exitCode = *code;
    return result;
}

std::optional<std::vector<std::string>> splitCommandLine(const std::string& commandLine) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    size_t i = 0;

    while (i < commandLine.size()) {
        char c = commandLine[i];
        if (c == '\'') {
            size_t end = commandLine.find('\'', i + 1);
            if (end == std::string::npos) {
                return std::nullopt;
            }
            current.append(commandLine, i + 1, end - i - 1);
            inWord = true;
            i = end + 1;
        } else if (c == '"') {
            ++i;
            bool closed = false;
            while (i < commandLine.size()) {
                char d = commandLine[i];
                if (d == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (d == '\\' && i + 1 < commandLine.size() &&
                    std::strchr("\\\"$`", commandLine[i + 1]) != nullptr) {
                    current += commandLine[i + 1];
                    i += 2;
                    continue;
                }
                current += d;
                ++i;
            }
            if (!closed) {
                return std::nullopt;
            }
            inWord = true;
        } else if (c == '\\') {
            if (i + 1 < commandLine.size()) {
                current += commandLine[i + 1];
                inWord = true;
            }
            i += 2;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                words.push_back(std::move(current));
                current.clear();
                inWord = false;
            }
            ++i;
        } else {
            current += c;
            inWord = true;
            ++i;
        }
    }
    if (inWord) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        bool needsQuotes = arg.empty() || arg.find_first_of(" \t\n'\"") != std::string::npos;
        if (needsQuotes) {
            out += '\'';
            for (char c : arg) {
                if (c == '\'') {
                    out += "'\\''";
                } else {
                    out += c;
                }
            }
            out += '\'';
        } else {
            out += arg;
        }
    }
    return out;
}

} } // namespace crawl_archiver::container
