#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::optional<std::string> ProcessRunner::findExecutable(const std::string &name) const
{
    if (name.find('/') != std::string::npos)
    {
        if (access(name.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr)
    {
        return std::nullopt;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':'))
    {
        if (dir.empty())
            continue;
        fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
        {
            return candidate.string();
        }
    }
    return std::nullopt;
}

ProcessOutput ProcessRunner::run(const std::vector<std::string> &args) const
{
    ProcessOutput result;
    if (args.empty())
    {
        result.output = "No program given";
        return result;
    }

    std::string command = buildCommandLine(args) + " 2>&1";
    Logger::debug("Running: " + command);

    FILE *pipe = popen(command.c_str(), "r");
    if (!pipe)
    {
        Logger::error("Failed to execute " + args.front());
        result.output = "popen failed";
        return result;
    }

    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
    {
        result.output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1)
    {
        result.exit_code = -1;
    }
    else if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else
    {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

std::string ProcessRunner::quoteArgument(const std::string &arg)
{
    std::string quoted = "'";
    for (char c : arg)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string ProcessRunner::buildCommandLine(const std::vector<std::string> &args)
{
    std::string command;
    for (const auto &arg : args)
    {
        if (!command.empty())
            command += ' ';
        command += quoteArgument(arg);
    }
    return command;
}
