#pragma once

#include <string>

/**
 * @brief Random tokens used to make output file names unique
 */
class UniqueSuffix
{
public:
    static constexpr size_t TOKEN_BYTES = 3;

    /**
     * @brief Generate a new token from the OpenSSL CSPRNG
     * @return 6 lowercase hexadecimal characters, e.g. "a3f91b"
     * @throws std::runtime_error if the random generator fails
     */
    static std::string newToken();

    // True if token is exactly 6 lowercase hex characters
    static bool isValidToken(const std::string &token);
};
