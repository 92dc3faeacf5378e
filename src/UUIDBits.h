#pragma once

// Writer-side bit helpers shared by the generators and the codec.
// Readers classify through NanoUUID::version() / NanoUUID::variant().

#include <stdint.h>
#include "NanoUUID.h"

// 100ns intervals between 1582-10-15 00:00 and 1970-01-01 00:00 (UTC).
#define NANOUUID_GREGORIAN_OFFSET 0x01B21DD213814000ULL

#define NANOUUID_TICKS_MASK   0x0FFFFFFFFFFFFFFFULL  // 60 bits
#define NANOUUID_UNIX_MS_MASK 0x0000FFFFFFFFFFFFULL  // 48 bits

/**
 * @brief Overwrite the version nibble of byte 6.
 * Nil, Max and Reserved are not assignable and leave the bytes unchanged.
 */
inline void uuid_set_version(uint8_t* b, UUIDVersion v) noexcept {
    if (v < UUID_VERSION_1 || v > UUID_VERSION_8) return;
    b[6] = (uint8_t)((b[6] & 0x0F) | ((uint8_t)v << 4));
}

/** @brief Overwrite the variant bits of byte 8, keeping the payload bits. */
inline void uuid_set_variant(uint8_t* b, UUIDVariant v) noexcept {
    switch (v) {
        case UUID_VARIANT_NCS:       b[8] = (uint8_t)(b[8] & 0x7F); break;
        case UUID_VARIANT_RFC:       b[8] = (uint8_t)((b[8] & 0x3F) | 0x80); break;
        case UUID_VARIANT_MICROSOFT: b[8] = (uint8_t)((b[8] & 0x1F) | 0xC0); break;
        case UUID_VARIANT_FUTURE:    b[8] = (uint8_t)(b[8] | 0xE0); break;
    }
}

// Converts between network order and the mixed-endian GUID layout.
// The operation is its own inverse.
inline void uuid_swap_fields(uint8_t* b) noexcept {
    uint8_t t;
    t = b[0]; b[0] = b[3]; b[3] = t;
    t = b[1]; b[1] = b[2]; b[2] = t;
    t = b[4]; b[4] = b[5]; b[5] = t;
    t = b[6]; b[6] = b[7]; b[7] = t;
}

inline void uuid_store_be16(uint8_t* p, uint16_t v) noexcept {
    p[0] = (uint8_t)(v >> 8);
    p[1] = (uint8_t)(v & 0xFF);
}

inline void uuid_store_be32(uint8_t* p, uint32_t v) noexcept {
    p[0] = (uint8_t)(v >> 24);
    p[1] = (uint8_t)((v >> 16) & 0xFF);
    p[2] = (uint8_t)((v >> 8) & 0xFF);
    p[3] = (uint8_t)(v & 0xFF);
}

inline uint16_t uuid_load_be16(const uint8_t* p) noexcept {
    return (uint16_t)(((uint16_t)p[0] << 8) | p[1]);
}

inline uint32_t uuid_load_be32(const uint8_t* p) noexcept {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
           ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}
