// WatchParty - Watch-party signaling and process supervision core
// Process Supervisor implementation (POSIX fork/exec)

#include "watchparty/process/process_supervisor.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <map>
#include <sstream>

namespace watchparty {
namespace process {

namespace {

constexpr int READ_POLL_MS = 100;
constexpr auto DRAIN_LIMIT = std::chrono::seconds(1);
constexpr auto TREE_POLL_INTERVAL = std::chrono::milliseconds(100);

std::string joinCommand(const std::vector<std::string>& command) {
    std::string text;
    for (const auto& part : command) {
        if (!text.empty()) {
            text += ' ';
        }
        text += part;
    }
    return text;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief Parent pid and state from /proc/<pid>/stat.
 *
 * The command name may contain spaces and parentheses, so parsing starts
 * after the last ')'.
 */
bool readProcStat(pid_t pid, pid_t& parent, char& state) {
    std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
    if (!file.is_open()) {
        return false;
    }
    std::string content;
    std::getline(file, content);

    size_t nameEnd = content.rfind(')');
    if (nameEnd == std::string::npos) {
        return false;
    }
    std::istringstream rest(content.substr(nameEnd + 1));
    long ppid = 0;
    if (!(rest >> state >> ppid)) {
        return false;
    }
    parent = static_cast<pid_t>(ppid);
    return true;
}

bool isAlive(pid_t pid) {
    pid_t parent = 0;
    char state = '?';
    if (!readProcStat(pid, parent, state)) {
        return false;
    }
    return state != 'Z' && state != 'X';
}

/**
 * @brief All live descendants of @p root, parents before children.
 */
std::vector<pid_t> collectDescendants(pid_t root) {
    std::multimap<pid_t, pid_t> children;

    DIR* dir = opendir("/proc");
    if (dir == nullptr) {
        return {};
    }
    while (dirent* entry = readdir(dir)) {
        if (!std::isdigit(static_cast<unsigned char>(entry->d_name[0]))) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::strtol(entry->d_name, nullptr, 10));
        pid_t parent = 0;
        char state = '?';
        if (readProcStat(pid, parent, state) && state != 'Z' && state != 'X') {
            children.emplace(parent, pid);
        }
    }
    closedir(dir);

    std::vector<pid_t> result;
    std::vector<pid_t> frontier{root};
    while (!frontier.empty()) {
        pid_t current = frontier.back();
        frontier.pop_back();
        auto range = children.equal_range(current);
        for (auto it = range.first; it != range.second; ++it) {
            result.push_back(it->second);
            frontier.push_back(it->second);
        }
    }
    return result;
}

void readResourceUsage(pid_t pid, ProcessInfo& info) {
    std::ifstream file("/proc/" + std::to_string(pid) + "/status");
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream fields(line);
        std::string key;
        fields >> key;
        if (key == "VmRSS:") {
            fields >> info.residentKb;
        } else if (key == "Threads:") {
            fields >> info.threadCount;
        }
    }
}

} // anonymous namespace

// =============================================================================
// Internal Records
// =============================================================================

struct ProcessSupervisor::Child {
    pid_t pid = -1;
    int stdoutFd = -1;
    int stderrFd = -1;
};

struct ProcessSupervisor::Record {
    std::string name;
    LaunchSpec spec;
    pid_t pid = -1;
    bool exited = false;                ///< Current run has been reaped
    bool stopRequested = false;
    core::SystemClock::time_point startTime;
    uint32_t restartCount = 0;
    std::optional<ProcessStats> stats;
    std::thread monitor;
};

// =============================================================================
// Construction
// =============================================================================

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<pal::ILogPAL> logger,
                                     std::chrono::milliseconds restartDelay)
    : logger_(std::move(logger))
    , restartDelay_(restartDelay)
{
}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

core::Result<void, core::Error> ProcessSupervisor::start(const std::string& name,
                                                         LaunchSpec spec) {
    if (spec.command.empty() || spec.command.front().empty()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "empty command", name));
    }

    reapFinished();

    std::lock_guard<std::mutex> lock(mutex_);
    if (shuttingDown_) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "supervisor is shut down", name));
    }
    if (records_.count(name) != 0) {
        WATCHPARTY_LOG_WARNING(logger_, "Supervisor", "Process already running: " + name);
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::ProcessAlreadyRunning, "name is already tracked", name));
    }

    auto child = launch(name, spec);
    if (child.isError()) {
        WATCHPARTY_LOG_ERROR(logger_, "Supervisor", child.error().toString());
        return core::Result<void, core::Error>::error(child.error());
    }

    auto record = std::make_shared<Record>();
    record->name = name;
    record->spec = std::move(spec);
    record->pid = child.value().pid;
    record->startTime = core::SystemClock::now();
    records_[name] = record;

    record->monitor = std::thread(&ProcessSupervisor::monitorLoop, this, record,
                                  child.value().pid, child.value().stdoutFd,
                                  child.value().stderrFd);

    WATCHPARTY_LOG_INFO(logger_, "Supervisor",
        "Started " + name + " (pid " + std::to_string(record->pid) + "): " +
        joinCommand(record->spec.command));
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> ProcessSupervisor::stop(const std::string& name,
                                                        std::chrono::milliseconds timeout) {
    return terminate(name, timeout, false);
}

core::Result<void, core::Error> ProcessSupervisor::stopTree(const std::string& name,
                                                            std::chrono::milliseconds timeout) {
    return terminate(name, timeout, true);
}

void ProcessSupervisor::stopAll(std::chrono::milliseconds timeout) {
    std::vector<std::pair<std::string, bool>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : records_) {
            targets.emplace_back(entry.first, entry.second->spec.processTree);
        }
    }

    for (const auto& target : targets) {
        auto result = target.second ? stopTree(target.first, timeout)
                                    : stop(target.first, timeout);
        if (result.isError() && result.error().code != core::ErrorCode::ProcessNotFound) {
            WATCHPARTY_LOG_WARNING(logger_, "Supervisor",
                "Failed to stop " + target.first + ": " + result.error().toString());
        }
    }

    reapFinished();
}

void ProcessSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shuttingDown_ = true;
    }
    cv_.notify_all();
    stopAll(DEFAULT_STOP_TIMEOUT);
}

bool ProcessSupervisor::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shuttingDown_;
}

// =============================================================================
// Inspection
// =============================================================================

bool ProcessSupervisor::isRunning(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    return it != records_.end() && !it->second->exited;
}

std::optional<ProcessInfo> ProcessSupervisor::info(const std::string& name) const {
    ProcessInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            return std::nullopt;
        }
        const Record& record = *it->second;
        info.name = name;
        info.pid = record.exited ? -1 : record.pid;
        info.startTime = record.startTime;
        info.restartCount = record.restartCount;
        info.running = !record.exited;
        info.stats = record.stats;
    }

    if (info.pid > 0) {
        readResourceUsage(info.pid, info);
    }
    return info;
}

std::vector<std::string> ProcessSupervisor::trackedNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(records_.size());
    for (const auto& entry : records_) {
        names.push_back(entry.first);
    }
    return names;
}

void ProcessSupervisor::updateStats(const std::string& name, const ProcessStats& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it != records_.end()) {
        it->second->stats = stats;
    }
}

// =============================================================================
// Launch
// =============================================================================

core::Result<ProcessSupervisor::Child, core::Error> ProcessSupervisor::launch(
    const std::string& name, const LaunchSpec& spec)
{
    using LaunchResult = core::Result<Child, core::Error>;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};

    if (pipe2(outPipe, O_CLOEXEC) < 0 || pipe2(errPipe, O_CLOEXEC) < 0 ||
        pipe2(execPipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int* fds : {outPipe, errPipe, execPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return LaunchResult::error(core::Error(core::ErrorCode::ProcessLaunchFailed,
            std::string("pipe failed: ") + strerror(err), name));
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(spec.command.size() + 1);
    for (const auto& arg : spec.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* workdir = spec.workingDirectory.empty() ? nullptr
                                                        : spec.workingDirectory.c_str();
    long maxFd = sysconf(_SC_OPEN_MAX);
    if (maxFd < 0 || maxFd > 65536) {
        maxFd = 65536;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int* fds : {outPipe, errPipe, execPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return LaunchResult::error(core::Error(core::ErrorCode::ProcessLaunchFailed,
            std::string("fork failed: ") + strerror(err), name));
    }

    if (pid == 0) {
        // Child: own process group, no terminal input
        setpgid(0, 0);

        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        for (int fd = 3; fd < maxFd; ++fd) {
            if (fd != execPipe[1]) {
                close(fd);
            }
        }

        if (workdir == nullptr || chdir(workdir) == 0) {
            execvp(argv[0], argv.data());
        }

        int err = errno;
        ssize_t written = write(execPipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);

        std::string reason = workdir != nullptr && childErrno == ENOENT
            ? "cannot execute " + spec.command.front() + " in " + spec.workingDirectory
            : "cannot execute " + spec.command.front();
        return LaunchResult::error(core::Error(core::ErrorCode::ProcessLaunchFailed,
            reason + ": " + strerror(childErrno), name));
    }

    Child child;
    child.pid = pid;
    child.stdoutFd = outPipe[0];
    child.stderrFd = errPipe[0];
    return LaunchResult::success(child);
}

// =============================================================================
// Monitoring
// =============================================================================

void ProcessSupervisor::monitorLoop(std::shared_ptr<Record> record, pid_t pid,
                                    int stdoutFd, int stderrFd) {
    const std::string name = record->name;

    while (true) {
        std::atomic<bool> runFinished{false};
        std::thread outReader([&]() {
            readStream(stdoutFd, record->spec.onStdout, name, runFinished);
        });
        std::thread errReader([&]() {
            readStream(stderrFd, record->spec.onStderr, name, runFinished);
        });

        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
        int exitStatus = waited == pid ? decodeWaitStatus(status) : -1;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            record->exited = true;
        }
        cv_.notify_all();

        runFinished = true;
        outReader.join();
        errReader.join();

        std::unique_lock<std::mutex> lock(mutex_);
        if (record->stopRequested) {
            return;
        }

        WATCHPARTY_LOG_INFO(logger_, "Supervisor",
            name + " exited with status " + std::to_string(exitStatus));

        if (record->spec.restartOnExit && !shuttingDown_) {
            WATCHPARTY_LOG_WARNING(logger_, "Supervisor",
                "Restarting " + name + " in " + std::to_string(restartDelay_.count()) + " ms");

            cv_.wait_for(lock, restartDelay_, [&]() {
                return record->stopRequested || shuttingDown_;
            });
            if (record->stopRequested) {
                return;
            }

            if (!shuttingDown_) {
                auto child = launch(name, record->spec);
                if (child.isSuccess()) {
                    pid = child.value().pid;
                    stdoutFd = child.value().stdoutFd;
                    stderrFd = child.value().stderrFd;
                    record->pid = pid;
                    record->exited = false;
                    record->restartCount++;
                    record->startTime = core::SystemClock::now();
                    WATCHPARTY_LOG_INFO(logger_, "Supervisor",
                        "Restarted " + name + " (pid " + std::to_string(pid) + ", restart #" +
                        std::to_string(record->restartCount) + ")");
                    continue;
                }
                WATCHPARTY_LOG_ERROR(logger_, "Supervisor",
                    "Restart failed: " + child.error().toString());
                exitStatus = -1;
            }
        }

        // Ended on its own: this thread removes the record
        auto it = records_.find(name);
        if (it != records_.end() && it->second == record) {
            finished_.push_back(std::move(record->monitor));
            records_.erase(it);
        }
        ExitCallback onExit = record->spec.onExit;
        bool notify = !shuttingDown_;
        lock.unlock();
        cv_.notify_all();

        if (onExit && notify) {
            onExit(exitStatus);
        }
        return;
    }
}

void ProcessSupervisor::readStream(int fd, const OutputCallback& callback,
                                   const std::string& name,
                                   const std::atomic<bool>& runFinished) {
    std::string pending;
    char buffer[4096];
    std::optional<core::SteadyClock::time_point> drainDeadline;

    auto emit = [&](const std::string& line) {
        if (line.empty() || !callback) {
            return;
        }
        try {
            callback(line);
        } catch (const std::exception& e) {
            WATCHPARTY_LOG_ERROR(logger_, "Supervisor",
                "Output callback for " + name + " threw: " + e.what());
        }
    };

    while (true) {
        if (runFinished.load()) {
            // Descendants may hold the pipe open; only drain what is there
            if (!drainDeadline) {
                drainDeadline = core::SteadyClock::now() + DRAIN_LIMIT;
            } else if (core::SteadyClock::now() >= *drainDeadline) {
                break;
            }
        }

        pollfd pfd{fd, POLLIN, 0};
        int rc = poll(&pfd, 1, READ_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            WATCHPARTY_LOG_WARNING(logger_, "Supervisor",
                "poll failed for " + name + ": " + strerror(errno));
            break;
        }
        if (rc == 0) {
            if (runFinished.load()) {
                break;
            }
            continue;
        }

        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t start = 0;
        size_t pos;
        while ((pos = pending.find_first_of("\r\n", start)) != std::string::npos) {
            emit(pending.substr(start, pos - start));
            start = pos + 1;
        }
        pending.erase(0, start);
    }

    emit(pending);
    close(fd);
}

// =============================================================================
// Termination
// =============================================================================

core::Result<void, core::Error> ProcessSupervisor::terminate(const std::string& name,
                                                             std::chrono::milliseconds timeout,
                                                             bool wholeTree) {
    std::shared_ptr<Record> record;
    pid_t pid = -1;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            return core::Result<void, core::Error>::error(
                core::Error(core::ErrorCode::ProcessNotFound, "name is not tracked", name));
        }
        record = it->second;

        if (record->stopRequested) {
            // Another caller is already stopping it
            cv_.wait(lock, [&]() {
                auto current = records_.find(name);
                return current == records_.end() || current->second != record;
            });
            return core::Result<void, core::Error>::success();
        }

        record->stopRequested = true;
        if (!record->exited) {
            pid = record->pid;
        }
    }
    cv_.notify_all();

    const auto deadline = core::SteadyClock::now() + timeout;
    std::vector<pid_t> descendants;

    if (pid > 0) {
        if (wholeTree) {
            descendants = collectDescendants(pid);
        }
        WATCHPARTY_LOG_INFO(logger_, "Supervisor",
            "Stopping " + name + " (pid " + std::to_string(pid) + ", " +
            std::to_string(descendants.size()) + " descendants)");

        for (pid_t child : descendants) {
            if (kill(child, SIGTERM) < 0 && errno != ESRCH) {
                WATCHPARTY_LOG_DEBUG(logger_, "Supervisor",
                    "SIGTERM to " + std::to_string(child) + " failed: " + strerror(errno));
            }
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (!record->exited && kill(pid, SIGTERM) < 0 && errno != ESRCH) {
            WATCHPARTY_LOG_WARNING(logger_, "Supervisor",
                "SIGTERM to " + name + " failed: " + strerror(errno));
        }

        bool exited = cv_.wait_until(lock, deadline, [&]() { return record->exited; });
        if (!exited) {
            WATCHPARTY_LOG_WARNING(logger_, "Supervisor",
                name + " did not exit within " + std::to_string(timeout.count()) +
                " ms, killing");
            if (kill(pid, SIGKILL) < 0 && errno != ESRCH) {
                WATCHPARTY_LOG_ERROR(logger_, "Supervisor",
                    "SIGKILL to " + name + " failed: " + strerror(errno));
            }
            if (!cv_.wait_for(lock, KILL_GRACE, [&]() { return record->exited; })) {
                WATCHPARTY_LOG_ERROR(logger_, "Supervisor",
                    name + " still running after SIGKILL");
            }
        }
    }

    if (!descendants.empty()) {
        auto alive = [&]() {
            return std::any_of(descendants.begin(), descendants.end(), isAlive);
        };
        while (alive() && core::SteadyClock::now() < deadline) {
            std::this_thread::sleep_for(TREE_POLL_INTERVAL);
        }
        for (pid_t child : descendants) {
            if (isAlive(child)) {
                WATCHPARTY_LOG_WARNING(logger_, "Supervisor",
                    "Killing leftover descendant " + std::to_string(child) + " of " + name);
                if (kill(child, SIGKILL) < 0 && errno != ESRCH) {
                    WATCHPARTY_LOG_ERROR(logger_, "Supervisor",
                        "SIGKILL to " + std::to_string(child) + " failed: " + strerror(errno));
                }
            }
        }
    }

    std::thread monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it != records_.end() && it->second == record) {
            monitor = std::move(record->monitor);
            records_.erase(it);
        }
    }
    cv_.notify_all();

    if (monitor.joinable()) {
        if (monitor.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(std::move(monitor));
        } else {
            monitor.join();
        }
    }

    WATCHPARTY_LOG_INFO(logger_, "Supervisor", "Stopped " + name);
    return core::Result<void, core::Error>::success();
}

void ProcessSupervisor::reapFinished() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(finished_);
    }

    for (auto& thread : threads) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(std::move(thread));
        } else {
            thread.join();
        }
    }
}

} // namespace process
} // namespace watchparty
