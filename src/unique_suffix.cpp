#include "core/unique_suffix.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string UniqueSuffix::newToken()
{
    unsigned char bytes[TOKEN_BYTES];
    if (RAND_bytes(bytes, static_cast<int>(TOKEN_BYTES)) != 1)
    {
        char err_buf[256];
        ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
        throw std::runtime_error("Secure random generator failed: " + std::string(err_buf));
    }

    std::stringstream ss;
    for (size_t i = 0; i < TOKEN_BYTES; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return ss.str();
}

bool UniqueSuffix::isValidToken(const std::string &token)
{
    if (token.size() != TOKEN_BYTES * 2)
        return false;
    for (char c : token)
    {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    }
    return true;
}
