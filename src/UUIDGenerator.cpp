#include "UUIDGenerator.h"
#include "UUIDBits.h"
#include "UUIDDigest.h"

#include <string.h>

const char* uuidGenErrorName(UUIDGenError e) noexcept {
    switch (e) {
        case UUID_GEN_OK:                  return "ok";
        case UUID_GEN_ENTROPY_UNAVAILABLE: return "entropy unavailable";
        case UUID_GEN_CLOCK_UNAVAILABLE:   return "clock unavailable";
        case UUID_GEN_NODE_UNAVAILABLE:    return "node unavailable";
        case UUID_GEN_DIGEST_UNAVAILABLE:  return "digest unavailable";
        case UUID_GEN_UNSUPPORTED_VERSION: break;
    }
    return "unsupported version";
}

// --- CLASS IMPLEMENTATION ---

UUIDGenerator::UUIDGenerator(fill_random_fn rng, void* rng_ctx, now_ms_fn now, void* now_ctx) noexcept
    : _rng(rng), _rng_ctx(rng_ctx), _now(now), _now_ctx(now_ctx),
      _ticks(nullptr), _ticks_ctx(nullptr),
      _node(nullptr), _node_ctx(nullptr),
      _nodePolicy(UUID_NODE_FAIL_FAST)
{
}

void UUIDGenerator::setTickSource(now_ticks_fn ticks, void* ctx) noexcept {
    _ticks = ticks;
    _ticks_ctx = ctx;
}

void UUIDGenerator::setNodeSource(node_fn node, void* ctx) noexcept {
    _node = node;
    _node_ctx = ctx;
}

UUIDGenError UUIDGenerator::_fillRandom(uint8_t* dest, size_t len) const noexcept {
    fill_random_fn rng = _rng ? _rng : &UUIDGenerator::default_fill_random;
    if (!rng(dest, len, _rng_ctx)) return UUID_GEN_ENTROPY_UNAVAILABLE;

    // Health check: a source stuck at zero is treated as failed.
    uint8_t sum = 0;
    for (size_t i = 0; i < len; i++) sum |= dest[i];
    if (sum == 0) return UUID_GEN_ENTROPY_UNAVAILABLE;

    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::_gregorianInputs(uint64_t& ticks, uint16_t& clockSeq, uint8_t node[6]) const noexcept {
    // [0..1] clock sequence, [2..7] fallback node
    uint8_t rnd[8];
    UUIDGenError err = _fillRandom(rnd, sizeof(rnd));
    if (err != UUID_GEN_OK) return err;

    if (_ticks) {
        ticks = _ticks(_ticks_ctx);
    } else {
        now_ms_fn now = _now ? _now : &UUIDGenerator::default_now_ms;
        uint64_t ms = now(_now_ctx);
        ticks = (ms == 0) ? 0 : ms * 10000 + NANOUUID_GREGORIAN_OFFSET;
    }
    if (ticks == 0) return UUID_GEN_CLOCK_UNAVAILABLE;

    // No stable storage in here, so every call starts a fresh random sequence.
    clockSeq = (uint16_t)(uuid_load_be16(rnd) & 0x3FFF);

    node_fn source = _node ? _node : &UUIDGenerator::default_node;
    if (!source(node, _node_ctx)) {
        if (_nodePolicy != UUID_NODE_RANDOM_FALLBACK) return UUID_GEN_NODE_UNAVAILABLE;
        memcpy(node, rnd + 2, 6);
        node[0] |= 0x01; // multicast bit marks a non-IEEE node (RFC 9562 6.10)
    }
    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::generateV1(NanoUUID& out) const noexcept {
    uint64_t ticks;
    uint16_t seq;
    uint8_t node[6];
    UUIDGenError err = _gregorianInputs(ticks, seq, node);
    if (err != UUID_GEN_OK) return err;

    out = v1(ticks, seq, node);
    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::generateV6(NanoUUID& out) const noexcept {
    uint64_t ticks;
    uint16_t seq;
    uint8_t node[6];
    UUIDGenError err = _gregorianInputs(ticks, seq, node);
    if (err != UUID_GEN_OK) return err;

    out = v6(ticks, seq, node);
    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::generateV4(NanoUUID& out) const noexcept {
    uint8_t rnd[16];
    UUIDGenError err = _fillRandom(rnd, sizeof(rnd));
    if (err != UUID_GEN_OK) return err;

    out = v4(rnd);
    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::generateV7(NanoUUID& out) const noexcept {
    // Draw entropy before reading the clock so the timestamp is as fresh as possible.
    uint8_t rnd[10];
    UUIDGenError err = _fillRandom(rnd, sizeof(rnd));
    if (err != UUID_GEN_OK) return err;

    now_ms_fn now = _now ? _now : &UUIDGenerator::default_now_ms;
    uint64_t now_ms = now(_now_ctx);
    if (now_ms == 0) return UUID_GEN_CLOCK_UNAVAILABLE;

    uint16_t rand_a = uuid_load_be16(rnd);
    uint64_t rand_b = ((uint64_t)uuid_load_be32(rnd + 2) << 32) | uuid_load_be32(rnd + 6);

    out = v7(now_ms, rand_a, rand_b);
    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::generate(UUIDVersion version, NanoUUID& out) const noexcept {
    switch (version) {
        case UUID_VERSION_1: return generateV1(out);
        case UUID_VERSION_4: return generateV4(out);
        case UUID_VERSION_6: return generateV6(out);
        case UUID_VERSION_7: return generateV7(out);
        default:             return UUID_GEN_UNSUPPORTED_VERSION;
    }
}

// --- PURE BUILDERS ---

NanoUUID UUIDGenerator::v1(uint64_t ticks, uint16_t clockSeq, const uint8_t node[6]) noexcept {
    ticks &= NANOUUID_TICKS_MASK;
    uint8_t b[16];

    uuid_store_be32(b, (uint32_t)(ticks & 0xFFFFFFFFULL));      // time_low
    uuid_store_be16(b + 4, (uint16_t)((ticks >> 32) & 0xFFFF)); // time_mid
    uuid_store_be16(b + 6, (uint16_t)(ticks >> 48));            // time_hi (12 bits)
    uuid_store_be16(b + 8, clockSeq);
    memcpy(b + 10, node, 6);

    uuid_set_version(b, UUID_VERSION_1);
    uuid_set_variant(b, UUID_VARIANT_RFC);
    return NanoUUID(b);
}

NanoUUID UUIDGenerator::v6(uint64_t ticks, uint16_t clockSeq, const uint8_t node[6]) noexcept {
    ticks &= NANOUUID_TICKS_MASK;
    uint8_t b[16];

    uuid_store_be32(b, (uint32_t)(ticks >> 28));                // time_high
    uuid_store_be16(b + 4, (uint16_t)((ticks >> 12) & 0xFFFF)); // time_mid
    uuid_store_be16(b + 6, (uint16_t)(ticks & 0x0FFF));         // time_low (12 bits)
    uuid_store_be16(b + 8, clockSeq);
    memcpy(b + 10, node, 6);

    uuid_set_version(b, UUID_VERSION_6);
    uuid_set_variant(b, UUID_VARIANT_RFC);
    return NanoUUID(b);
}

NanoUUID UUIDGenerator::v4(const uint8_t random[16]) noexcept {
    uint8_t b[16];
    memcpy(b, random, 16);
    uuid_set_version(b, UUID_VERSION_4);
    uuid_set_variant(b, UUID_VARIANT_RFC);
    return NanoUUID(b);
}

static UUIDGenError name_based(UUIDDigestAlgorithm alg, UUIDVersion version, const NanoUUID& ns,
                               const uint8_t* name, size_t len, NanoUUID& out) {
    uint8_t b[16];
    if (!uuid_digest(alg, ns.data(), name, len, b)) return UUID_GEN_DIGEST_UNAVAILABLE;

    uuid_set_version(b, version);
    uuid_set_variant(b, UUID_VARIANT_RFC);
    out = NanoUUID(b);
    return UUID_GEN_OK;
}

UUIDGenError UUIDGenerator::v3(const NanoUUID& ns, const uint8_t* name, size_t len, NanoUUID& out) noexcept {
    return name_based(UUID_DIGEST_MD5, UUID_VERSION_3, ns, name, len, out);
}

UUIDGenError UUIDGenerator::v3(const NanoUUID& ns, const char* name, NanoUUID& out) noexcept {
    return v3(ns, (const uint8_t*)name, name ? strlen(name) : 0, out);
}

UUIDGenError UUIDGenerator::v5(const NanoUUID& ns, const uint8_t* name, size_t len, NanoUUID& out) noexcept {
    return name_based(UUID_DIGEST_SHA1, UUID_VERSION_5, ns, name, len, out);
}

UUIDGenError UUIDGenerator::v5(const NanoUUID& ns, const char* name, NanoUUID& out) noexcept {
    return v5(ns, (const uint8_t*)name, name ? strlen(name) : 0, out);
}

NanoUUID UUIDGenerator::v7(uint64_t unixMs, uint16_t randA, uint64_t randB) noexcept {
    uint64_t ts = unixMs & NANOUUID_UNIX_MS_MASK;
    uint8_t b[16];

    for (int i = 5; i >= 0; i--) {
        b[i] = (uint8_t)(ts & 0xFF);
        ts >>= 8;
    }
    uuid_store_be16(b + 6, (uint16_t)(randA & 0x0FFF));
    uuid_store_be32(b + 8, (uint32_t)(randB >> 32));
    uuid_store_be32(b + 12, (uint32_t)(randB & 0xFFFFFFFFULL));

    uuid_set_version(b, UUID_VERSION_7);
    uuid_set_variant(b, UUID_VARIANT_RFC);
    return NanoUUID(b);
}

NanoUUID UUIDGenerator::v8(const uint8_t custom[16]) noexcept {
    uint8_t b[16];
    memcpy(b, custom, 16);
    uuid_set_version(b, UUID_VERSION_8);
    uuid_set_variant(b, UUID_VARIANT_RFC);
    return NanoUUID(b);
}
