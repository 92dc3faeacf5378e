#include "NanoUUID.h"
#include "UUIDBits.h"

// --- TABLES ---

#define XX 0xFF

// ASCII hex digit -> nibble value, XX for anything else (including bytes >= 0x80).
static const uint8_t kHexValue[256] = {
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x00
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x10
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x20
     0,  1,  2,  3,  4,  5,  6,  7,  8,  9, XX, XX, XX, XX, XX, XX,  // 0x30
    XX, 10, 11, 12, 13, 14, 15, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x40
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x50
    XX, 10, 11, 12, 13, 14, 15, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x60
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x70
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x80
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0x90
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0xA0
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0xB0
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0xC0
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0xD0
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX,  // 0xE0
    XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX, XX   // 0xF0
};

#undef XX

static const char kHexLower[] = "0123456789abcdef";
static const char kHexUpper[] = "0123456789ABCDEF";

static const char kUrnPrefix[] = "urn:uuid:";
static const size_t kUrnPrefixLen = sizeof(kUrnPrefix) - 1;

// Hyphen offsets inside the 36-character canonical body.
static const uint8_t kHyphenPos[4] = { 8, 13, 18, 23 };

// --- INTERNAL HELPERS ---

static UUIDParseResult parse_result(UUIDParseError error, size_t offset) {
    UUIDParseResult r;
    r.error = error;
    r.offset = offset;
    return r;
}

static size_t format_length(UUIDFormat format) {
    switch (format) {
        case UUID_FORMAT_SIMPLE: return NANOUUID_SIMPLE_LENGTH;
        case UUID_FORMAT_BRACED: return NANOUUID_BRACED_LENGTH;
        case UUID_FORMAT_URN:    return NANOUUID_URN_LENGTH;
        case UUID_FORMAT_ANY:
        case UUID_FORMAT_HYPHENATED: break;
    }
    return NANOUUID_HYPHENATED_LENGTH;
}

static UUIDFormat detect_format(size_t len) {
    switch (len) {
        case NANOUUID_SIMPLE_LENGTH:     return UUID_FORMAT_SIMPLE;
        case NANOUUID_HYPHENATED_LENGTH: return UUID_FORMAT_HYPHENATED;
        case NANOUUID_BRACED_LENGTH:     return UUID_FORMAT_BRACED;
        case NANOUUID_URN_LENGTH:        return UUID_FORMAT_URN;
        default:                         return UUID_FORMAT_ANY;
    }
}

static char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? (char)(c - 'A' + 'a') : c;
}

// Validates framing, then decodes. `out` is written only on success.
static UUIDParseResult parse_bytes(const char* str, size_t len, UUIDFormat format, uint8_t out[16]) {
    if (!str) return parse_result(UUID_PARSE_INVALID_LENGTH, 0);

    if (format == UUID_FORMAT_ANY) {
        format = detect_format(len);
        if (format == UUID_FORMAT_ANY) {
            return parse_result(UUID_PARSE_INVALID_LENGTH, 0);
        }
    } else {
        size_t expected = format_length(format);
        if (len != expected) {
            return parse_result(UUID_PARSE_INVALID_LENGTH, len < expected ? len : expected);
        }
    }

    // 1. Prefix and braces
    size_t body = 0;
    if (format == UUID_FORMAT_URN) {
        for (size_t i = 0; i < kUrnPrefixLen; i++) {
            if (ascii_lower(str[i]) != kUrnPrefix[i]) {
                return parse_result(UUID_PARSE_UNRECOGNIZED_FORMAT, i);
            }
        }
        body = kUrnPrefixLen;
    } else if (format == UUID_FORMAT_BRACED) {
        if (str[0] != '{') return parse_result(UUID_PARSE_INVALID_SEPARATOR, 0);
        if (str[len - 1] != '}') return parse_result(UUID_PARSE_INVALID_SEPARATOR, len - 1);
        body = 1;
    }

    // 2. Hyphen positions
    bool dashed = (format != UUID_FORMAT_SIMPLE);
    if (dashed) {
        for (size_t k = 0; k < sizeof(kHyphenPos); k++) {
            size_t pos = body + kHyphenPos[k];
            if (str[pos] != '-') return parse_result(UUID_PARSE_INVALID_SEPARATOR, pos);
        }
    }

    // 3. Digits
    uint8_t tmp[16];
    size_t pos = body;
    for (int i = 0; i < 16; i++) {
        if (dashed && (i == 4 || i == 6 || i == 8 || i == 10)) {
            pos++;
        }

        uint8_t hi = kHexValue[(uint8_t)str[pos]];
        if (hi == 0xFF) {
            return parse_result(str[pos] == '-' ? UUID_PARSE_INVALID_SEPARATOR
                                                : UUID_PARSE_INVALID_CHARACTER, pos);
        }
        uint8_t lo = kHexValue[(uint8_t)str[pos + 1]];
        if (lo == 0xFF) {
            return parse_result(str[pos + 1] == '-' ? UUID_PARSE_INVALID_SEPARATOR
                                                    : UUID_PARSE_INVALID_CHARACTER, pos + 1);
        }

        tmp[i] = (uint8_t)((hi << 4) | lo);
        pos += 2;
    }

    memcpy(out, tmp, 16);
    return parse_result(UUID_PARSE_OK, 0);
}

static bool format_bytes(const uint8_t* b, char* out, size_t buflen, UUIDFormat format, UUIDCase letterCase) {
    size_t required = format_length(format) + 1;
    if (!out || buflen < required) return false;

    const char* hex = (letterCase == UUID_CASE_UPPER) ? kHexUpper : kHexLower;
    bool dashed = (format != UUID_FORMAT_SIMPLE);
    char* s = out;

    if (format == UUID_FORMAT_URN) {
        memcpy(s, kUrnPrefix, kUrnPrefixLen);
        s += kUrnPrefixLen;
    } else if (format == UUID_FORMAT_BRACED) {
        *s++ = '{';
    }

    for (int i = 0; i < 16; i++) {
        if (dashed && (i == 4 || i == 6 || i == 8 || i == 10)) {
            *s++ = '-';
        }
        *s++ = hex[(b[i] >> 4) & 0x0F];
        *s++ = hex[b[i] & 0x0F];
    }

    if (format == UUID_FORMAT_BRACED) {
        *s++ = '}';
    }
    *s = '\0';
    return true;
}

// --- PUBLIC API ---

const char* uuidParseErrorName(UUIDParseError e) noexcept {
    switch (e) {
        case UUID_PARSE_OK:                  return "ok";
        case UUID_PARSE_INVALID_LENGTH:      return "invalid length";
        case UUID_PARSE_INVALID_CHARACTER:   return "invalid character";
        case UUID_PARSE_INVALID_SEPARATOR:   return "invalid separator";
        case UUID_PARSE_UNRECOGNIZED_FORMAT: break;
    }
    return "unrecognized format";
}

bool NanoUUID::toString(char* out, size_t buflen, UUIDFormat format, UUIDCase letterCase) const noexcept {
    return format_bytes(_b, out, buflen, format, letterCase);
}

bool NanoUUID::toStringMixedEndian(char* out, size_t buflen, UUIDFormat format, UUIDCase letterCase) const noexcept {
    uint8_t swapped[16];
    toBytesMixedEndian(swapped);
    return format_bytes(swapped, out, buflen, format, letterCase);
}

UUIDParseResult NanoUUID::parse(const char* str, size_t len, NanoUUID& out, UUIDFormat format) noexcept {
    uint8_t bytes[16];
    UUIDParseResult r = parse_bytes(str, len, format, bytes);
    if (r.ok()) out = NanoUUID(bytes);
    return r;
}

UUIDParseResult NanoUUID::parse(const char* str, NanoUUID& out, UUIDFormat format) noexcept {
    return parse(str, str ? strlen(str) : 0, out, format);
}

UUIDParseResult NanoUUID::parseMixedEndian(const char* str, size_t len, NanoUUID& out, UUIDFormat format) noexcept {
    uint8_t bytes[16];
    UUIDParseResult r = parse_bytes(str, len, format, bytes);
    if (r.ok()) out = NanoUUID::fromBytesMixedEndian(bytes);
    return r;
}

UUIDParseResult NanoUUID::parseMixedEndian(const char* str, NanoUUID& out, UUIDFormat format) noexcept {
    return parseMixedEndian(str, str ? strlen(str) : 0, out, format);
}
