#include "executor.hpp"

#include "../core/errors.hpp"
#include "../core/time_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace cmdbench::shell
{

namespace
{

// Owns a posix_spawn_file_actions_t for the lifetime of one spawn.
struct FileActions
{
    posix_spawn_file_actions_t actions;

    FileActions()
    {
        posix_spawn_file_actions_init(&actions);
    }
    ~FileActions()
    {
        posix_spawn_file_actions_destroy(&actions);
    }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;
};

std::string failureMessage(const ExecutionResult& r)
{
    std::ostringstream oss;
    if (r.termSignal)
        oss << "The process has been terminated by a signal";
    else if (r.exitCode)
        oss << "Command terminated with non-zero exit code: " << *r.exitCode;
    else
        oss << "Command terminated with an unknown exit status";
    oss << ". Use the '-i'/'--ignore-failure' option if you want to ignore "
           "this. Alternatively, use the '--show-output' option to debug "
           "what went wrong.";
    return oss.str();
}

} // namespace

std::optional<int> exitCodeFromStatus(int waitStatus)
{
    if (WIFEXITED(waitStatus))
        return WEXITSTATUS(waitStatus);
    if (WIFSIGNALED(waitStatus))
        return 128 + WTERMSIG(waitStatus);
    return std::nullopt;
}

ExecutionResult Executor::run(const std::string& command, bool showOutput,
                              FailureAction action)
{
    ExecutionResult r = spawnAndWait(command, showOutput);

    switch (action)
    {
        case FailureAction::RaiseError:
            if (!r.success)
                throw CommandFailedError(failureMessage(r), r.exitCode);
            break;
        case FailureAction::Ignore:
            break;
    }
    return r;
}

ShellExecutor::ShellExecutor(const std::string& shell) : shellSpec(shell)
{
    std::istringstream iss(shell);
    std::string word;
    while (iss >> word)
        shellArgv.push_back(word);
    if (shellArgv.empty())
        throw ConfigError("The shell must not be empty");
}

std::string ShellExecutor::describe(const std::string& command) const
{
    return shellSpec + " -c \"" + command + "\"";
}

ExecutionResult ShellExecutor::spawnAndWait(const std::string& command,
                                            bool showOutput)
{
    std::vector<std::string> args = shellArgv;
    args.push_back("-c");
    args.push_back(command);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    FileActions fa;
    posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null",
                                     O_RDONLY, 0);
    if (!showOutput)
    {
        posix_spawn_file_actions_addopen(&fa.actions, STDOUT_FILENO,
                                         "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&fa.actions, STDERR_FILENO,
                                         "/dev/null", O_WRONLY, 0);
    }

    timeutil::WallClockTimer timer;

    pid_t pid = -1;
    const int spawnRet = posix_spawnp(&pid, argv[0], &fa.actions, nullptr,
                                      argv.data(), environ);
    if (spawnRet != 0)
    {
        throw SpawnError("Failed to start shell '" + shellSpec +
                         "': " + std::strerror(spawnRet));
    }

    int status = 0;
    struct rusage usage{};
    pid_t waited = -1;
    do
    {
        waited = ::wait4(pid, &status, 0, &usage);
    } while (waited == -1 && errno == EINTR);

    const Second wall = timer.elapsed();

    if (waited == -1)
    {
        throw SpawnError("Failed to wait for shell '" + shellSpec +
                         "': " + std::strerror(errno));
    }

    ExecutionResult r;
    r.timing.real = wall;
    r.timing.user = timeutil::toSeconds(usage.ru_utime);
    r.timing.system = timeutil::toSeconds(usage.ru_stime);
    r.exitCode = exitCodeFromStatus(status);
    if (WIFSIGNALED(status))
        r.termSignal = WTERMSIG(status);
    r.success = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    return r;
}

} // namespace cmdbench::shell
