#pragma once

#include <string>
#include <utility>

/**
 * @brief Turns user supplied file names into portable, safe names
 *
 * The base name of a sanitized name only contains [A-Za-z0-9._-], never
 * starts or ends with '.', '_' or '-', and is never empty. The extension is
 * carried over verbatim.
 */
class FilenameSanitizer
{
public:
    static constexpr const char *DEFAULT_PLACEHOLDER = "arquivo";

    /**
     * @brief Sanitize a raw file name
     *
     * Trims surrounding whitespace, splits at the last dot, replaces each
     * whitespace run in the base with '_', drops characters outside the
     * allow-set and trims '.', '_' and '-' from both ends of the base.
     * An empty base is replaced by the placeholder.
     *
     * @param raw_name Display name such as "My Photo! (1).jpeg"
     * @param placeholder Base used when nothing usable remains
     * @return Sanitized name such as "My_Photo_1.jpeg"
     */
    static std::string sanitize(const std::string &raw_name,
                                const std::string &placeholder = DEFAULT_PLACEHOLDER);

    /**
     * @brief Split a file name into base and extension
     *
     * The extension starts at the last dot and includes it. Leading dots do
     * not start an extension, so ".profile" has no extension.
     */
    static std::pair<std::string, std::string> splitExtension(const std::string &name);

    /**
     * @brief Name shown to the user: base name trimmed, whitespace runs collapsed to one space
     */
    static std::string displayName(const std::string &path);

    // True if base is non-empty, in the allow-set and has no edge '.', '_' or '-'
    static bool isSafeBase(const std::string &base);

    static bool isAllowedChar(char c);

private:
    static std::string trimWhitespace(const std::string &value);
    static std::string collapseWhitespace(const std::string &value, const std::string &replacement);
};
