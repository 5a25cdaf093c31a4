#include "core/script_sections.hpp"
#include <sstream>

std::vector<ScriptSection> ScriptSections::split(const ScriptText &script)
{
    std::vector<std::string> pieces = splitParagraphs(script);
    if (pieces.size() == 1)
    {
        pieces = splitSentences(pieces.front());
    }

    std::vector<ScriptSection> sections;
    sections.reserve(pieces.size());
    for (auto &piece : pieces)
    {
        sections.push_back(ScriptSection{sections.size(), std::move(piece)});
    }
    return sections;
}

std::vector<std::string> ScriptSections::splitParagraphs(const std::string &text)
{
    std::vector<std::string> paragraphs;
    std::istringstream stream(text);
    std::string line;
    std::string current;

    auto flush = [&]()
    {
        std::string trimmed = trim(current);
        if (!trimmed.empty())
            paragraphs.push_back(trimmed);
        current.clear();
    };

    while (std::getline(stream, line))
    {
        if (trim(line).empty())
        {
            flush();
            continue;
        }
        if (!current.empty())
            current += ' ';
        current += trim(line);
    }
    flush();
    return paragraphs;
}

std::vector<std::string> ScriptSections::splitSentences(const std::string &text)
{
    std::vector<std::string> sentences;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i)
    {
        current += text[i];
        bool terminator = text[i] == '.' || text[i] == '!' || text[i] == '?';
        bool boundary = i + 1 == text.size() || text[i + 1] == ' ';
        if (terminator && boundary)
        {
            std::string trimmed = trim(current);
            if (!trimmed.empty())
                sentences.push_back(trimmed);
            current.clear();
        }
    }

    std::string rest = trim(current);
    if (!rest.empty())
        sentences.push_back(rest);
    return sentences;
}

std::string ScriptSections::trim(const std::string &text)
{
    const char *whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return "";
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}
