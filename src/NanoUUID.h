#pragma once

#define NANOUUID_LIB_VERSION "2.0.0"

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#if !defined(ARDUINO)
    #include <ostream>
#endif

#if defined(ARDUINO)
    #include <Arduino.h>
#endif

// Textual lengths, NUL terminator excluded.
#define NANOUUID_SIMPLE_LENGTH      32
#define NANOUUID_HYPHENATED_LENGTH  36
#define NANOUUID_BRACED_LENGTH      38
#define NANOUUID_URN_LENGTH         45

// Buffer size that fits every dialect plus the NUL terminator.
#define NANOUUID_STRING_MAX         46

/**
 * Version tag read from the high nibble of byte 6.
 * Assigned versions carry their nibble as discriminant. Nil and Max describe
 * the whole value and take precedence over the nibble.
 */
enum UUIDVersion {
    UUID_VERSION_RESERVED = 0,  // nibble 0 or 9-15
    UUID_VERSION_1 = 1,         // Gregorian time, historical field order
    UUID_VERSION_2 = 2,         // DCE security
    UUID_VERSION_3 = 3,         // MD5 name-based
    UUID_VERSION_4 = 4,         // Random
    UUID_VERSION_5 = 5,         // SHA-1 name-based
    UUID_VERSION_6 = 6,         // Gregorian time, sortable field order
    UUID_VERSION_7 = 7,         // Unix epoch milliseconds
    UUID_VERSION_8 = 8,         // Custom / vendor
    UUID_VERSION_NIL = 0x10,    // 00000000-0000-0000-0000-000000000000
    UUID_VERSION_MAX = 0x11     // ffffffff-ffff-ffff-ffff-ffffffffffff
};

/**
 * Variant tag read from the top three bits of byte 8.
 * Discriminants are the bit patterns with "don't care" bits cleared.
 */
enum UUIDVariant {
    UUID_VARIANT_NCS = 0,        // 0xx
    UUID_VARIANT_RFC = 2,        // 10x (RFC 9562 / RFC 4122)
    UUID_VARIANT_MICROSOFT = 6,  // 110
    UUID_VARIANT_FUTURE = 7      // 111
};

enum UUIDFormat {
    UUID_FORMAT_ANY,         // Parse: detect by length. Format: same as HYPHENATED.
    UUID_FORMAT_HYPHENATED,  // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    UUID_FORMAT_BRACED,      // {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}
    UUID_FORMAT_SIMPLE,      // xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx
    UUID_FORMAT_URN          // urn:uuid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
};

enum UUIDCase {
    UUID_CASE_LOWER,
    UUID_CASE_UPPER
};

enum UUIDParseError {
    UUID_PARSE_OK = 0,
    UUID_PARSE_INVALID_LENGTH,      // length matches no (or not the requested) dialect
    UUID_PARSE_INVALID_CHARACTER,   // non-hex byte where a digit is expected
    UUID_PARSE_INVALID_SEPARATOR,   // hyphen or brace missing or misplaced
    UUID_PARSE_UNRECOGNIZED_FORMAT  // URN length without the urn:uuid: prefix
};

/**
 * @brief Outcome of a parse. offset is the index of the first offending byte
 * (for length errors: where the input and the expected length diverge).
 */
struct UUIDParseResult {
    UUIDParseError error;
    size_t offset;

    bool ok() const { return error == UUID_PARSE_OK; }
    explicit operator bool() const { return ok(); }
};

const char* uuidVersionName(UUIDVersion v) noexcept;
const char* uuidVariantName(UUIDVariant v) noexcept;
const char* uuidParseErrorName(UUIDParseError e) noexcept;

#if defined(ARDUINO)
class NanoUUID : public Printable {
#else
class NanoUUID {
#endif
public:
    /** @brief Nil UUID (all zero bytes). */
    NanoUUID() noexcept {
        memset(_b, 0, sizeof(_b));
    }

    /**
     * @brief Wrap 16 bytes in network order. Every byte pattern is accepted.
     * @param bytes Source 16-byte array.
     */
    explicit NanoUUID(const uint8_t bytes[16]) noexcept {
        memcpy(_b, bytes, 16);
    }

    static NanoUUID fromBytes(const uint8_t bytes[16]) noexcept { return NanoUUID(bytes); }

    /**
     * @brief Import bytes stored in the legacy mixed-endian (GUID) layout,
     * where time_low, time_mid and time_hi_and_version are little-endian.
     */
    static NanoUUID fromBytesMixedEndian(const uint8_t bytes[16]) noexcept;

    static NanoUUID nil() noexcept { return NanoUUID(); }

    /**
     * @brief Max UUID (all 0xFF bytes).
     * Not named max(): AVR and several other Arduino cores define max(a,b) as a macro.
     */
    static NanoUUID maxValue() noexcept;

    // --- RFC 9562 section 6.6 namespace IDs ---
    // Built from constant byte tables on every call, so they are usable from
    // static initializers in any translation unit.

    static NanoUUID namespaceDns() noexcept;
    static NanoUUID namespaceUrl() noexcept;
    static NanoUUID namespaceOid() noexcept;
    static NanoUUID namespaceX500() noexcept;

    /**
     * @brief Access raw 16 bytes in network order.
     * @return Pointer to internal byte array.
     */
    const uint8_t* data() const noexcept { return _b; }

    void toBytes(uint8_t out[16]) const noexcept { memcpy(out, _b, 16); }
    void toBytesMixedEndian(uint8_t out[16]) const noexcept;

    bool isNil() const noexcept;
    bool isMax() const noexcept;

    // --- Classification (total over all byte patterns) ---

    UUIDVersion version() const noexcept;
    UUIDVariant variant() const noexcept;

    // --- RFC 9562 field view, meaningful for time-based layouts ---

    uint32_t timeLow() const noexcept;
    uint16_t timeMid() const noexcept;
    uint16_t timeHiAndVersion() const noexcept;
    uint8_t clockSeqHiAndReserved() const noexcept { return _b[8]; }
    uint8_t clockSeqLow() const noexcept { return _b[9]; }
    void node(uint8_t out[6]) const noexcept { memcpy(out, _b + 10, 6); }

    /**
     * @brief Decode the 60-bit count of 100ns ticks since 1582-10-15.
     * Reads the interleaved layout for v1 and the sortable layout for v6.
     * @param ticks Receives the tick count.
     * @return false if this is not an RFC-variant v1 or v6 UUID.
     */
    bool gregorianTicks(uint64_t& ticks) const noexcept;

    /**
     * @brief Decode the creation time as Unix epoch milliseconds.
     * v7 stores it directly; v1/v6 ticks are converted.
     * @return false for other versions, or for v1/v6 ticks before 1970.
     */
    bool unixTimestampMs(uint64_t& ms) const noexcept;

    /**
     * @brief 14-bit clock sequence of a v1/v6 UUID.
     * @return false if this is not an RFC-variant v1 or v6 UUID.
     */
    bool clockSequence(uint16_t& seq) const noexcept;

    // --- Text ---

    /**
     * @brief Format into a caller buffer.
     * @param out Destination buffer.
     * @param buflen Length of destination buffer, including room for NUL.
     * @param format Dialect to write. UUID_FORMAT_ANY writes the hyphenated form.
     * @param letterCase Case of the hex digits. The URN prefix stays lowercase.
     * @return true if successful, false if out is null or buffer is too small.
     */
    bool toString(char* out, size_t buflen,
                  UUIDFormat format = UUID_FORMAT_HYPHENATED,
                  UUIDCase letterCase = UUID_CASE_LOWER) const noexcept;

    /**
     * @brief Format with the first three fields byte-swapped (legacy GUID text).
     * Same buffer contract as toString().
     */
    bool toStringMixedEndian(char* out, size_t buflen,
                             UUIDFormat format = UUID_FORMAT_HYPHENATED,
                             UUIDCase letterCase = UUID_CASE_LOWER) const noexcept;

    /**
     * @brief Parse text into a UUID. Hex digits are case-insensitive.
     * Length and separators are validated before any digit is decoded.
     * @param str Source characters (need not be NUL-terminated).
     * @param len Number of characters in str.
     * @param out Receives the value; left untouched on failure.
     * @param format Expected dialect, or UUID_FORMAT_ANY to detect by length.
     */
    static UUIDParseResult parse(const char* str, size_t len, NanoUUID& out,
                                 UUIDFormat format = UUID_FORMAT_ANY) noexcept;

    /** @brief parse() for a NUL-terminated string. */
    static UUIDParseResult parse(const char* str, NanoUUID& out,
                                 UUIDFormat format = UUID_FORMAT_ANY) noexcept;

    /**
     * @brief Parse text written in the legacy mixed-endian dialect.
     * Accepts the same shapes as parse(); the first three fields are swapped
     * back to network order. Never selected automatically by parse().
     */
    static UUIDParseResult parseMixedEndian(const char* str, size_t len, NanoUUID& out,
                                            UUIDFormat format = UUID_FORMAT_ANY) noexcept;

    static UUIDParseResult parseMixedEndian(const char* str, NanoUUID& out,
                                            UUIDFormat format = UUID_FORMAT_ANY) noexcept;

#if defined(ARDUINO)
    size_t printTo(Print &p) const override {
        char buf[NANOUUID_HYPHENATED_LENGTH + 1];
        toString(buf, sizeof(buf));
        return p.print(buf);
    }
#endif

    // --- Comparison ---

    bool operator==(const NanoUUID& other) const { return memcmp(_b, other._b, 16) == 0; }
    bool operator!=(const NanoUUID& other) const { return !(*this == other); }

    /** @brief Byte-wise ordering. Matches creation order for v6 and v7. */
    bool operator< (const NanoUUID& other) const { return memcmp(_b, other._b, 16) < 0; }

#if !defined(ARDUINO)
    friend std::ostream& operator<<(std::ostream& os, const NanoUUID& uuid) {
        char buf[NANOUUID_HYPHENATED_LENGTH + 1];
        uuid.toString(buf, sizeof(buf));
        os << buf;
        return os;
    }
#endif

private:
    uint8_t _b[16];
};
