#include "NanoUUID.h"
#include "UUIDBits.h"

// --- NAMESPACE IDS (RFC 9562, section 6.6) ---

static const uint8_t kNamespaceDns[16] = {
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t kNamespaceUrl[16] = {
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t kNamespaceOid[16] = {
    0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t kNamespaceX500[16] = {
    0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};

NanoUUID NanoUUID::namespaceDns() noexcept { return NanoUUID(kNamespaceDns); }
NanoUUID NanoUUID::namespaceUrl() noexcept { return NanoUUID(kNamespaceUrl); }
NanoUUID NanoUUID::namespaceOid() noexcept { return NanoUUID(kNamespaceOid); }
NanoUUID NanoUUID::namespaceX500() noexcept { return NanoUUID(kNamespaceX500); }

// --- DIAGNOSTIC NAMES ---

const char* uuidVersionName(UUIDVersion v) noexcept {
    switch (v) {
        case UUID_VERSION_1:   return "v1";
        case UUID_VERSION_2:   return "v2";
        case UUID_VERSION_3:   return "v3";
        case UUID_VERSION_4:   return "v4";
        case UUID_VERSION_5:   return "v5";
        case UUID_VERSION_6:   return "v6";
        case UUID_VERSION_7:   return "v7";
        case UUID_VERSION_8:   return "v8";
        case UUID_VERSION_NIL: return "Nil";
        case UUID_VERSION_MAX: return "Max";
        case UUID_VERSION_RESERVED: break;
    }
    return "Reserved";
}

const char* uuidVariantName(UUIDVariant v) noexcept {
    switch (v) {
        case UUID_VARIANT_NCS:       return "NCS";
        case UUID_VARIANT_RFC:       return "RFC 9562";
        case UUID_VARIANT_MICROSOFT: return "Microsoft";
        case UUID_VARIANT_FUTURE:    break;
    }
    return "Future";
}

// --- CLASS IMPLEMENTATION ---

NanoUUID NanoUUID::fromBytesMixedEndian(const uint8_t bytes[16]) noexcept {
    uint8_t tmp[16];
    memcpy(tmp, bytes, 16);
    uuid_swap_fields(tmp);
    return NanoUUID(tmp);
}

NanoUUID NanoUUID::maxValue() noexcept {
    uint8_t ones[16];
    memset(ones, 0xFF, sizeof(ones));
    return NanoUUID(ones);
}

void NanoUUID::toBytesMixedEndian(uint8_t out[16]) const noexcept {
    memcpy(out, _b, 16);
    uuid_swap_fields(out);
}

bool NanoUUID::isNil() const noexcept {
    uint8_t acc = 0;
    for (size_t i = 0; i < sizeof(_b); i++) acc |= _b[i];
    return acc == 0;
}

bool NanoUUID::isMax() const noexcept {
    uint8_t acc = 0xFF;
    for (size_t i = 0; i < sizeof(_b); i++) acc &= _b[i];
    return acc == 0xFF;
}

UUIDVersion NanoUUID::version() const noexcept {
    // Whole-value constants win over the nibble (both nibbles are otherwise reserved).
    if (isNil()) return UUID_VERSION_NIL;
    if (isMax()) return UUID_VERSION_MAX;

    uint8_t nibble = (_b[6] >> 4) & 0x0F;
    if (nibble >= UUID_VERSION_1 && nibble <= UUID_VERSION_8) {
        return (UUIDVersion)nibble;
    }
    return UUID_VERSION_RESERVED;
}

UUIDVariant NanoUUID::variant() const noexcept {
    uint8_t top = (_b[8] >> 5) & 0x07;
    if ((top & 0x04) == 0) return UUID_VARIANT_NCS;
    if ((top & 0x02) == 0) return UUID_VARIANT_RFC;
    if ((top & 0x01) == 0) return UUID_VARIANT_MICROSOFT;
    return UUID_VARIANT_FUTURE;
}

uint32_t NanoUUID::timeLow() const noexcept {
    return uuid_load_be32(_b);
}

uint16_t NanoUUID::timeMid() const noexcept {
    return uuid_load_be16(_b + 4);
}

uint16_t NanoUUID::timeHiAndVersion() const noexcept {
    return uuid_load_be16(_b + 6);
}

bool NanoUUID::gregorianTicks(uint64_t& ticks) const noexcept {
    if (variant() != UUID_VARIANT_RFC) return false;

    switch (version()) {
        case UUID_VERSION_1:
            // time_hi(12) | time_mid(16) | time_low(32)
            ticks = ((uint64_t)(_b[6] & 0x0F) << 56) |
                    ((uint64_t)_b[7] << 48) |
                    ((uint64_t)timeMid() << 32) |
                    (uint64_t)timeLow();
            return true;
        case UUID_VERSION_6:
            // time_high(32) | time_mid(16) | time_low(12)
            ticks = ((uint64_t)uuid_load_be32(_b) << 28) |
                    ((uint64_t)uuid_load_be16(_b + 4) << 12) |
                    ((uint64_t)(_b[6] & 0x0F) << 8) |
                    (uint64_t)_b[7];
            return true;
        default:
            return false;
    }
}

bool NanoUUID::unixTimestampMs(uint64_t& ms) const noexcept {
    if (variant() != UUID_VARIANT_RFC) return false;

    if (version() == UUID_VERSION_7) {
        uint64_t ts = 0;
        for (int i = 0; i < 6; i++) ts = (ts << 8) | _b[i];
        ms = ts;
        return true;
    }

    uint64_t ticks;
    if (!gregorianTicks(ticks)) return false;
    if (ticks < NANOUUID_GREGORIAN_OFFSET) return false;
    ms = (ticks - NANOUUID_GREGORIAN_OFFSET) / 10000;
    return true;
}

bool NanoUUID::clockSequence(uint16_t& seq) const noexcept {
    if (variant() != UUID_VARIANT_RFC) return false;
    UUIDVersion v = version();
    if (v != UUID_VERSION_1 && v != UUID_VERSION_6) return false;

    seq = (uint16_t)(((uint16_t)(_b[8] & 0x3F) << 8) | _b[9]);
    return true;
}
