#include "inkweather/text_layout.h"

#include <cctype>

namespace inkweather
{
namespace
{
std::vector<std::string> splitWords(const std::string &text)
{
    std::vector<std::string> words;
    size_t index = 0;
    while (index < text.size())
    {
        while (index < text.size() && text[index] == ' ')
        {
            ++index;
        }
        if (index >= text.size())
        {
            break;
        }
        size_t nextSpace = text.find(' ', index);
        if (nextSpace == std::string::npos)
        {
            nextSpace = text.size();
        }
        words.push_back(text.substr(index, nextSpace - index));
        index = nextSpace + 1;
    }
    return words;
}

void trimTrailingSpaces(std::string &text)
{
    while (!text.empty() && text.back() == ' ')
    {
        text.pop_back();
    }
}
} // namespace

std::string capitalizeWords(const std::string &text)
{
    std::string result = text;
    bool capitalizeNext = true;
    for (char &c : result)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (isalpha(uc))
        {
            c = static_cast<char>(capitalizeNext ? toupper(uc) : tolower(uc));
            capitalizeNext = false;
        }
        else
        {
            capitalizeNext = true;
        }
    }
    return result;
}

std::string fitText(const Surface &surface, const std::string &text, FontRole font, int maxWidth)
{
    if (surface.measureText(text, font) <= maxWidth)
    {
        return text;
    }

    std::string shortened = text;
    while (!shortened.empty())
    {
        shortened.pop_back();
        trimTrailingSpaces(shortened);
        const std::string candidate = shortened + ELLIPSIS;
        if (surface.measureText(candidate, font) <= maxWidth)
        {
            return candidate;
        }
    }
    return surface.measureText(ELLIPSIS, font) <= maxWidth ? std::string(ELLIPSIS) : std::string();
}

std::vector<std::string> wrapText(const Surface &surface, const std::string &text, FontRole font, int maxWidth,
                                  size_t maxLines)
{
    std::vector<std::string> lines;
    if (maxLines == 0)
    {
        return lines;
    }

    const std::vector<std::string> words = splitWords(text);
    std::string line;
    for (size_t i = 0; i < words.size(); ++i)
    {
        const std::string candidate = line.empty() ? words[i] : line + ' ' + words[i];
        if (line.empty() || surface.measureText(candidate, font) <= maxWidth)
        {
            line = candidate;
            continue;
        }

        if (lines.size() + 1 == maxLines)
        {
            // Last allowed line: keep what fits and mark the cut.
            std::string rest = line;
            for (size_t j = i; j < words.size(); ++j)
            {
                rest += ' ' + words[j];
            }
            lines.push_back(fitText(surface, rest, font, maxWidth));
            return lines;
        }

        lines.push_back(fitText(surface, line, font, maxWidth));
        line = words[i];
    }

    if (!line.empty())
    {
        lines.push_back(fitText(surface, line, font, maxWidth));
    }
    return lines;
}

} // namespace inkweather
