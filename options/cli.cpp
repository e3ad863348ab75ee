#include "cli.hpp"

#include "../core/errors.hpp"
#include "../core/numeric.hpp"
#include "config_file.hpp"

#include <optional>
#include <sstream>

namespace cmdbench::cli
{

namespace
{

// Walks the argument vector. Values are taken from `--opt=value` or from
// the next argument.
class ArgCursor
{
  public:
    explicit ArgCursor(const std::vector<std::string>& arguments) :
        args(arguments)
    {}

    bool done() const
    {
        return pos >= args.size();
    }

    // Splits the current argument into the option name and an inline value.
    std::string next()
    {
        inlineValue.reset();
        std::string arg = args[pos++];
        if (arg.rfind("--", 0) == 0)
        {
            const auto eq = arg.find('=');
            if (eq != std::string::npos)
            {
                inlineValue = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }
        return arg;
    }

    std::string value(const std::string& option)
    {
        if (inlineValue)
        {
            std::string v = *inlineValue;
            inlineValue.reset();
            return v;
        }
        if (done())
            throw ConfigError("Missing value for option '" + option + "'");
        return args[pos++];
    }

    bool hasInlineValue() const
    {
        return inlineValue.has_value();
    }

    std::vector<std::string> rest()
    {
        std::vector<std::string> out(args.begin() + pos, args.end());
        pos = args.size();
        return out;
    }

  private:
    const std::vector<std::string>& args;
    std::size_t pos{0};
    std::optional<std::string> inlineValue;
};

std::uint64_t countValue(const std::string& option, const std::string& text)
{
    auto v = numeric::parseUnsigned(text);
    if (!v)
        throw ConfigError("Invalid value '" + text + "' for option '" +
                          option + "': expected a non-negative integer");
    return *v;
}

Second secondsValue(const std::string& option, const std::string& text)
{
    auto v = numeric::parseDecimal(text);
    if (!v)
        throw ConfigError("Invalid value '" + text + "' for option '" +
                          option + "': expected a number of seconds");
    return *v;
}

std::vector<params::ParameterValue> splitList(const std::string& text)
{
    std::vector<params::ParameterValue> out;
    std::string::size_type start = 0;
    while (true)
    {
        const auto comma = text.find(',', start);
        out.emplace_back(text.substr(start, comma - start));
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

// Values repeated on the command line replace the config file's list.
void appendRepeated(std::vector<std::string>& target, bool& fromCli,
                    std::string value)
{
    if (!fromCli)
    {
        target.clear();
        fromCli = true;
    }
    target.push_back(std::move(value));
}

std::optional<std::string> findConfigPath(const std::vector<std::string>& args)
{
    std::optional<std::string> path;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& a = args[i];
        if (a == "--")
            break;
        if (a == "--config")
        {
            if (i + 1 >= args.size())
                throw ConfigError("Missing value for option '--config'");
            path = args[++i];
        }
        else if (a.rfind("--config=", 0) == 0)
        {
            path = a.substr(9);
        }
    }
    return path;
}

} // namespace

ParsedArguments parseArguments(const std::vector<std::string>& args)
{
    ParsedArguments out;
    Options& o = out.options;

    if (auto path = findConfigPath(args))
        loadConfigFile(*path, o);

    std::vector<std::string> cliCommands;
    std::vector<params::ParameterScan> scans;
    std::optional<std::string> stepSize;
    bool cliPrepare = false;
    bool cliCleanup = false;
    bool cliNames = false;

    ArgCursor cur(args);
    while (!cur.done())
    {
        const std::string opt = cur.next();

        if (opt == "--")
        {
            for (auto& c : cur.rest())
                cliCommands.push_back(std::move(c));
        }
        else if (opt == "-h" || opt == "--help")
        {
            out.showHelp = true;
        }
        else if (opt == "-V" || opt == "--version")
        {
            out.showVersion = true;
        }
        else if (opt == "--config")
        {
            cur.value(opt); // already applied
        }
        else if (opt == "-w" || opt == "--warmup")
        {
            o.warmupCount = countValue(opt, cur.value(opt));
        }
        else if (opt == "-m" || opt == "--min-runs")
        {
            o.runs.min = countValue(opt, cur.value(opt));
        }
        else if (opt == "-M" || opt == "--max-runs")
        {
            o.runs.max = countValue(opt, cur.value(opt));
        }
        else if (opt == "-r" || opt == "--runs")
        {
            const auto n = countValue(opt, cur.value(opt));
            o.runs.min = n;
            o.runs.max = n;
        }
        else if (opt == "--min-benchmarking-time")
        {
            o.minBenchmarkingTime = secondsValue(opt, cur.value(opt));
        }
        else if (opt == "-p" || opt == "--prepare")
        {
            appendRepeated(o.preparationCommands, cliPrepare, cur.value(opt));
        }
        else if (opt == "-c" || opt == "--cleanup")
        {
            appendRepeated(o.cleanupCommands, cliCleanup, cur.value(opt));
        }
        else if (opt == "-n" || opt == "--command-name")
        {
            appendRepeated(o.commandNames, cliNames, cur.value(opt));
        }
        else if (opt == "-P" || opt == "--parameter-scan")
        {
            if (cur.hasInlineValue())
                throw ConfigError("Option '" + opt +
                                  "' takes three values: VAR MIN MAX");
            params::ParameterScan scan;
            scan.name = cur.value(opt);
            scan.min = cur.value(opt);
            scan.max = cur.value(opt);
            scans.push_back(std::move(scan));
        }
        else if (opt == "-D" || opt == "--parameter-step-size")
        {
            stepSize = cur.value(opt);
        }
        else if (opt == "-L" || opt == "--parameter-list")
        {
            if (cur.hasInlineValue())
                throw ConfigError("Option '" + opt +
                                  "' takes two values: VAR VALUES");
            params::ParameterList list;
            list.name = cur.value(opt);
            list.values = splitList(cur.value(opt));
            o.parameters.emplace_back(std::move(list));
        }
        else if (opt == "-S" || opt == "--shell")
        {
            o.shell = cur.value(opt);
        }
        else if (opt == "-i" || opt == "--ignore-failure")
        {
            o.failureAction = FailureAction::Ignore;
        }
        else if (opt == "--show-output")
        {
            o.showOutput = true;
        }
        else if (opt == "-s" || opt == "--style")
        {
            o.outputStyle = parseOutputStyle(cur.value(opt));
        }
        else if (opt == "-u" || opt == "--time-unit")
        {
            const std::string v = cur.value(opt);
            auto unit = units::parseTimeUnit(v);
            if (!unit)
                throw ConfigError("Unknown time unit '" + v +
                                  "' (expected 'second' or 'millisecond')");
            o.timeUnit = unit;
        }
        else if (opt == "--sort")
        {
            o.sortOrder = parseSortOrder(cur.value(opt));
        }
        else if (opt == "--export-csv")
        {
            o.exports.csvPath = cur.value(opt);
        }
        else if (opt == "--export-json")
        {
            o.exports.jsonPath = cur.value(opt);
        }
        else if (opt == "--export-markdown")
        {
            o.exports.markdownPath = cur.value(opt);
        }
        else if (opt == "--export-omit-times")
        {
            o.exports.includeTimes = false;
        }
        else if (opt == "--log-file")
        {
            o.logPath = cur.value(opt);
        }
        else if (opt.size() > 1 && opt.front() == '-')
        {
            throw ConfigError("Unknown option '" + opt + "'");
        }
        else
        {
            cliCommands.push_back(opt);
        }
    }

    if (stepSize && scans.empty())
        throw ConfigError(
            "'--parameter-step-size' requires '--parameter-scan'");
    for (auto& scan : scans)
    {
        if (stepSize)
            scan.step = *stepSize;
        o.parameters.emplace_back(std::move(scan));
    }

    for (auto& c : cliCommands)
        o.commands.push_back(std::move(c));

    return out;
}

ParsedArguments parseArguments(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parseArguments(args);
}

std::string usage()
{
    std::ostringstream oss;
    oss << "Usage: " << kProgramName << " [OPTIONS] <command>...\n"
        << "\n"
        << "Runs each command repeatedly through a shell and reports timing "
           "statistics.\n"
        << "\n"
        << "Options:\n"
        << "  -w, --warmup N                  Untimed runs before each "
           "benchmark (default 0)\n"
        << "  -m, --min-runs N                Minimum number of runs "
           "(default 10)\n"
        << "  -M, --max-runs N                Maximum number of runs\n"
        << "  -r, --runs N                    Exact number of runs\n"
        << "      --min-benchmarking-time S   Time budget used to size the "
           "run count (default 3)\n"
        << "  -p, --prepare CMD               Run CMD before every timing "
           "run (repeatable)\n"
        << "  -c, --cleanup CMD               Run CMD after all runs of a "
           "command (repeatable)\n"
        << "  -P, --parameter-scan VAR MIN MAX\n"
        << "                                  Benchmark once per value of "
           "VAR in [MIN, MAX]\n"
        << "  -D, --parameter-step-size STEP  Step of every parameter scan "
           "(default 1)\n"
        << "  -L, --parameter-list VAR V1,..  Benchmark once per listed "
           "value\n"
        << "  -n, --command-name NAME         Display name of a command "
           "(repeatable)\n"
        << "  -S, --shell SHELL               Shell used to run commands "
           "(default sh)\n"
        << "  -i, --ignore-failure            Ignore non-zero exit codes\n"
        << "      --show-output               Do not discard command "
           "output\n"
        << "  -s, --style full|basic|none     Output style\n"
        << "  -u, --time-unit second|millisecond\n"
        << "      --sort command|mean-time    Order of the summary\n"
        << "      --export-csv FILE           Write results as CSV\n"
        << "      --export-json FILE          Write results as JSON\n"
        << "      --export-markdown FILE      Write results as a Markdown "
           "table\n"
        << "      --export-omit-times         Leave raw samples out of the "
           "JSON export\n"
        << "      --log-file FILE             Append a run log to FILE\n"
        << "      --config FILE               Load options from a JSON "
           "file\n"
        << "  -h, --help                      Print this help\n"
        << "  -V, --version                   Print the version\n";
    return oss.str();
}

} // namespace cmdbench::cli
