#pragma once

#include <optional>
#include <string>
#include <vector>

struct ProcessOutput
{
    int exit_code = -1;
    std::string output; // stdout and stderr, interleaved
};

/**
 * @brief Runs external programs for the composer
 */
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Absolute path of an executable found on PATH, if any
     */
    virtual std::optional<std::string> findExecutable(const std::string &name) const = 0;

    /**
     * @brief Run a program to completion. args[0] is the program.
     */
    virtual ProcessOutput run(const std::vector<std::string> &args) const = 0;
};

/**
 * @brief CommandRunner over popen(); arguments are shell-quoted
 */
class ProcessRunner : public CommandRunner
{
public:
    std::optional<std::string> findExecutable(const std::string &name) const override;
    ProcessOutput run(const std::vector<std::string> &args) const override;

    static std::string quoteArgument(const std::string &arg);
    static std::string buildCommandLine(const std::vector<std::string> &args);
};
