#pragma once

#include <stdint.h>
#include <stddef.h>

enum UUIDDigestAlgorithm {
    UUID_DIGEST_MD5,   // v3
    UUID_DIGEST_SHA1   // v5
};

/**
 * @brief Hash namespace bytes followed by the name and keep the first 16 bytes.
 *
 * Backends: OpenSSL EVP on hosted builds, mbedTLS on ESP32.
 * Other Arduino targets have no backend and always fail.
 *
 * @param alg MD5 or SHA-1.
 * @param ns 16 namespace bytes in network order.
 * @param name Name bytes (may be null when len is 0).
 * @param len Number of name bytes.
 * @param out Receives the first 16 digest bytes.
 * @return false if the backend is missing or reports an error.
 */
bool uuid_digest(UUIDDigestAlgorithm alg, const uint8_t ns[16],
                 const uint8_t* name, size_t len, uint8_t out[16]) noexcept;
