/**
 * @file Uuid.cpp
 * @brief RFC 4122 version 4 identifier generation for debate events
 *
 * Every event published on the debate bus carries a random UUID so that
 * reactions and interjections can reference the speech they answer. Random
 * bytes come from the OpenSSL CSPRNG, not from the seeded simulation RNG.
 *
 * @note Throws std::runtime_error if OpenSSL cannot supply entropy
 */

#include "Uuid.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <stdexcept>
#include <cctype>

namespace senate {

/**
 * @brief Generate a random version 4 UUID
 *
 * Draws 16 bytes from RAND_bytes, then stamps the version nibble (0100)
 * and the RFC 4122 variant bits (10xx) before formatting.
 *
 * @return Lowercase canonical form, e.g. "3f2b8c1e-9a4d-4e7f-b1c2-0d9e8f7a6b5c"
 * @throws std::runtime_error if the OpenSSL random generator fails
 */
std::string Uuid::generateV4() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed: error " + std::to_string(ERR_get_error()));
    }

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    return format(bytes);
}

/**
 * @brief Check that a string is a canonical 36-character UUID
 * @param value Candidate identifier
 * @return True for 8-4-4-4-12 lowercase or uppercase hex groups
 */
bool Uuid::isValid(const std::string& value) {
    if (value.size() != 36) return false;

    for (std::size_t i = 0; i < value.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

std::string Uuid::format(const unsigned char (&bytes)[16]) {
    static const char hex[] = "0123456789abcdef";

    std::string result;
    result.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(hex[(bytes[i] >> 4) & 0x0F]);
        result.push_back(hex[bytes[i] & 0x0F]);
    }
    return result;
}

} // namespace senate
