#pragma once

#include <string>
#include <vector>
#include "core/pipeline_stages.hpp"

class ScriptSections
{
public:
    /**
     * @brief Split a script into ordered sections
     *
     * Paragraphs separated by blank lines become sections. A script with a
     * single paragraph is split after each '.', '!' or '?' instead. Whitespace
     * is trimmed and empty pieces are skipped.
     */
    static std::vector<ScriptSection> split(const ScriptText &script);

private:
    static std::vector<std::string> splitParagraphs(const std::string &text);
    static std::vector<std::string> splitSentences(const std::string &text);
    static std::string trim(const std::string &text);
};
