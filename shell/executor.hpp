#pragma once

#include "../core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cmdbench::shell
{

#ifdef _WIN32
inline constexpr const char* kDefaultShell = "cmd.exe";
#else
inline constexpr const char* kDefaultShell = "sh";
#endif

// Outcome of one finished child process.
struct ExecutionResult
{
    TimingResult timing;
    std::optional<int> exitCode;   // 128 + signal when killed by a signal
    std::optional<int> termSignal; // set when killed by a signal
    bool success{};
};

// Map a wait status to an exit code: the native code for a normal exit,
// 128 + s for termination by signal s, nothing otherwise.
std::optional<int> exitCodeFromStatus(int waitStatus);

// Spawns one command and reports its timing. Subclasses provide the actual
// process handling; the failure policy is applied here for all of them.
class Executor
{
  public:
    virtual ~Executor() = default;

    // Throws SpawnError if the command could not be started at all and
    // CommandFailedError for a non-zero exit under FailureAction::RaiseError.
    ExecutionResult run(const std::string& command, bool showOutput,
                        FailureAction action);

    // Human readable invocation, e.g. sh -c "make".
    virtual std::string describe(const std::string& command) const = 0;

  protected:
    virtual ExecutionResult spawnAndWait(const std::string& command,
                                         bool showOutput) = 0;
};

// Runs commands as `<shell> [shell args] -c <command>` and reads user/system
// time from the kernel's accounting of the reaped child.
class ShellExecutor : public Executor
{
  public:
    explicit ShellExecutor(const std::string& shell = kDefaultShell);

    const std::string& shell() const
    {
        return shellSpec;
    }

    std::string describe(const std::string& command) const override;

  protected:
    ExecutionResult spawnAndWait(const std::string& command,
                                 bool showOutput) override;

  private:
    std::string shellSpec;
    std::vector<std::string> shellArgv;
};

} // namespace cmdbench::shell
