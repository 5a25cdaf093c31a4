#pragma once

#include <string>
#include "core/pipeline_stages.hpp"

/**
 * @brief ScriptGenerator that reads a prepared script from a text file.
 *
 * Used when the script is written outside the factory; the topic is only logged.
 * A missing or blank file is INVALID_PROMPT.
 */
class ScriptFileGenerator : public ScriptGenerator
{
public:
    explicit ScriptFileGenerator(const std::string &script_path);

    void generate(const std::string &topic,
                  const std::string &language,
                  const CancellationToken &token,
                  Completion<GenerationResult> done) override;

private:
    std::string script_path_;
};
