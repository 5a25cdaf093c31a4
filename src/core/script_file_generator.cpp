#include "core/script_file_generator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

ScriptFileGenerator::ScriptFileGenerator(const std::string &script_path)
    : script_path_(script_path)
{
}

void ScriptFileGenerator::generate(const std::string &topic,
                                   const std::string &language,
                                   const CancellationToken &,
                                   Completion<GenerationResult> done)
{
    Logger::info("[LLM] Reading script for topic '" + topic + "' (" + language + ") from " + script_path_);

    std::ifstream file(script_path_);
    if (!file.is_open())
    {
        done(GenerationResult::Failure({GenerationErrorKind::INVALID_PROMPT, "Cannot open script file: " + script_path_}));
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string script = buffer.str();

    bool blank = std::all_of(script.begin(), script.end(), [](unsigned char c)
                             { return std::isspace(c) != 0; });
    if (blank)
    {
        done(GenerationResult::Failure({GenerationErrorKind::INVALID_PROMPT, "Script file is empty: " + script_path_}));
        return;
    }

    done(GenerationResult::Success(script));
}
