#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace cmdbench
{

// Base of every fatal condition the benchmark run can raise.
class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// The shell itself could not be started.
class SpawnError : public Error
{
  public:
    using Error::Error;
};

// A benchmarked command exited non-zero under FailureAction::RaiseError.
class CommandFailedError : public Error
{
  public:
    CommandFailedError(const std::string& what, std::optional<int> code) :
        Error(what), exitCode(code)
    {}

    std::optional<int> code() const
    {
        return exitCode;
    }

  private:
    std::optional<int> exitCode;
};

class PreparationError : public Error
{
  public:
    using Error::Error;
};

class CleanupError : public Error
{
  public:
    using Error::Error;
};

// Invalid options detected before anything is spawned.
class ConfigError : public Error
{
  public:
    using Error::Error;
};

class CalibrationError : public Error
{
  public:
    using Error::Error;
};

class ExportError : public Error
{
  public:
    using Error::Error;
};

} // namespace cmdbench
