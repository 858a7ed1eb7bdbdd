#include "core/filename_sanitizer.hpp"
#include <algorithm>
#include <filesystem>

namespace
{
    // Byte length of the whitespace code point starting at pos, 0 if there is none.
    // Covers the Unicode White_Space set plus the ASCII separators 0x1C-0x1F.
    size_t whitespaceLength(const std::string &value, size_t pos)
    {
        const auto byte = [&value](size_t i)
        { return i < value.size() ? static_cast<unsigned char>(value[i]) : 0u; };

        unsigned char lead = byte(pos);
        if ((lead >= 0x09 && lead <= 0x0D) || (lead >= 0x1C && lead <= 0x20))
            return 1;

        // U+0085, U+00A0
        if (lead == 0xC2 && (byte(pos + 1) == 0x85 || byte(pos + 1) == 0xA0))
            return 2;

        // U+1680
        if (lead == 0xE1 && byte(pos + 1) == 0x9A && byte(pos + 2) == 0x80)
            return 3;

        if (lead == 0xE2)
        {
            unsigned char second = byte(pos + 1);
            unsigned char third = byte(pos + 2);
            // U+2000-U+200A, U+2028, U+2029, U+202F
            if (second == 0x80 && ((third >= 0x80 && third <= 0x8A) || third == 0xA8 || third == 0xA9 || third == 0xAF))
                return 3;
            // U+205F
            if (second == 0x81 && third == 0x9F)
                return 3;
        }

        // U+3000
        if (lead == 0xE3 && byte(pos + 1) == 0x80 && byte(pos + 2) == 0x80)
            return 3;

        return 0;
    }

    bool isEdgeChar(char c)
    {
        return c == '.' || c == '_' || c == '-';
    }
}

std::string FilenameSanitizer::sanitize(const std::string &raw_name, const std::string &placeholder)
{
    std::string name = trimWhitespace(raw_name);
    auto [base, ext] = splitExtension(name);

    base = collapseWhitespace(base, "_");
    base.erase(std::remove_if(base.begin(), base.end(),
                              [](char c)
                              { return !isAllowedChar(c); }),
               base.end());

    size_t first = 0;
    while (first < base.size() && isEdgeChar(base[first]))
        ++first;
    size_t last = base.size();
    while (last > first && isEdgeChar(base[last - 1]))
        --last;
    base = base.substr(first, last - first);

    if (base.empty())
        base = placeholder.empty() ? DEFAULT_PLACEHOLDER : placeholder;

    return base + ext;
}

std::pair<std::string, std::string> FilenameSanitizer::splitExtension(const std::string &name)
{
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return {name, ""};

    // Only dots before the last one: no extension
    for (size_t i = 0; i < dot; ++i)
    {
        if (name[i] != '.')
            return {name.substr(0, dot), name.substr(dot)};
    }
    return {name, ""};
}

std::string FilenameSanitizer::displayName(const std::string &path)
{
    std::string name = std::filesystem::path(path).filename().string();
    return collapseWhitespace(trimWhitespace(name), " ");
}

bool FilenameSanitizer::isSafeBase(const std::string &base)
{
    if (base.empty() || isEdgeChar(base.front()) || isEdgeChar(base.back()))
        return false;
    return std::all_of(base.begin(), base.end(), isAllowedChar);
}

bool FilenameSanitizer::isAllowedChar(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

std::string FilenameSanitizer::trimWhitespace(const std::string &value)
{
    size_t begin = std::string::npos;
    size_t end = 0;
    size_t pos = 0;
    while (pos < value.size())
    {
        size_t space = whitespaceLength(value, pos);
        if (space > 0)
        {
            pos += space;
            continue;
        }
        if (begin == std::string::npos)
            begin = pos;
        end = ++pos;
    }

    if (begin == std::string::npos)
        return "";
    return value.substr(begin, end - begin);
}

std::string FilenameSanitizer::collapseWhitespace(const std::string &value, const std::string &replacement)
{
    std::string result;
    result.reserve(value.size());
    bool in_run = false;
    size_t pos = 0;
    while (pos < value.size())
    {
        size_t space = whitespaceLength(value, pos);
        if (space > 0)
        {
            if (!in_run)
                result += replacement;
            in_run = true;
            pos += space;
        }
        else
        {
            result += value[pos++];
            in_run = false;
        }
    }
    return result;
}
