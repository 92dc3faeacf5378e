#pragma once

#include <stdint.h>
#include <stddef.h>

#include "NanoUUID.h"

#ifndef NANOUUID_MIN_VALID_UNIX_MS
    // 2020-01-01T00:00:00Z. Wall clocks reading earlier than this are treated as unset.
    #define NANOUUID_MIN_VALID_UNIX_MS 1577836800000ULL
#endif

enum UUIDGenError {
    UUID_GEN_OK = 0,
    UUID_GEN_ENTROPY_UNAVAILABLE,  // RNG failed or produced all-zero output
    UUID_GEN_CLOCK_UNAVAILABLE,    // time source returned 0
    UUID_GEN_NODE_UNAVAILABLE,     // no node source and policy is FAIL_FAST
    UUID_GEN_DIGEST_UNAVAILABLE,   // no MD5/SHA-1 backend, or backend error
    UUID_GEN_UNSUPPORTED_VERSION   // version has no provider-backed generator
};

enum UUIDNodePolicy {
    UUID_NODE_FAIL_FAST,       // Report UUID_GEN_NODE_UNAVAILABLE (default)
    UUID_NODE_RANDOM_FALLBACK  // Use 48 random bits with the multicast bit set
};

const char* uuidGenErrorName(UUIDGenError e) noexcept;

/**
 * UUIDGenerator - Builders for every RFC 9562 layout.
 *
 * The static builders are pure: same inputs, same bytes.
 * An instance binds the Entropy/Clock/Node provider callbacks and offers
 * generateVx() on top of the builders. Instances hold configuration only,
 * so generation never mutates them and needs no locking.
 */
class UUIDGenerator {
public:
    typedef bool (*fill_random_fn)(uint8_t* dest, size_t len, void* ctx);
    typedef uint64_t (*now_ms_fn)(void* ctx);
    typedef uint64_t (*now_ticks_fn)(void* ctx);
    typedef bool (*node_fn)(uint8_t node[6], void* ctx);

    /**
     * @brief Initialize generator with optional custom RNG and Time sources.
     * @param rng Pointer to random fill function (nullptr for default).
     * @param rng_ctx User context for RNG.
     * @param now Pointer to Unix millisecond time function (nullptr for default).
     * @param now_ctx User context for time.
     */
    UUIDGenerator(fill_random_fn rng = nullptr, void* rng_ctx = nullptr,
                  now_ms_fn now = nullptr, void* now_ctx = nullptr) noexcept;

    /**
     * @brief Supply 100ns ticks since 1582-10-15 for v1/v6.
     * Without it, ticks are derived from the millisecond clock.
     */
    void setTickSource(now_ticks_fn ticks, void* ctx) noexcept;

    /**
     * @brief Supply the 48-bit node for v1/v6 (nullptr for default).
     */
    void setNodeSource(node_fn node, void* ctx) noexcept;

    /**
     * @brief Configure behavior when no node identifier is available.
     * @param policy Policy (Fail Fast or Random Fallback).
     */
    void setNodePolicy(UUIDNodePolicy policy) { _nodePolicy = policy; }

    UUIDNodePolicy getNodePolicy() const { return _nodePolicy; }

    // --- Provider-backed generation ---
    // On failure `out` is left untouched.

    UUIDGenError generateV1(NanoUUID& out) const noexcept;
    UUIDGenError generateV4(NanoUUID& out) const noexcept;
    UUIDGenError generateV6(NanoUUID& out) const noexcept;
    UUIDGenError generateV7(NanoUUID& out) const noexcept;

    /**
     * @brief Dispatch to generateV1/V4/V6/V7.
     * @return UUID_GEN_UNSUPPORTED_VERSION for any other version.
     */
    UUIDGenError generate(UUIDVersion version, NanoUUID& out) const noexcept;

    // --- Pure builders ---

    /**
     * @brief v1: ticks split into time_low / time_mid / time_hi.
     * @param ticks 100ns intervals since 1582-10-15; only the low 60 bits are used.
     * @param clockSeq Only the low 14 bits are used.
     * @param node 6-byte node identifier.
     */
    static NanoUUID v1(uint64_t ticks, uint16_t clockSeq, const uint8_t node[6]) noexcept;

    /** @brief v6: same inputs as v1, most significant time bits first. */
    static NanoUUID v6(uint64_t ticks, uint16_t clockSeq, const uint8_t node[6]) noexcept;

    /** @brief v4: 16 random bytes with version and variant overwritten. */
    static NanoUUID v4(const uint8_t random[16]) noexcept;

    /**
     * @brief v3: MD5(namespace || name).
     * @return UUID_GEN_DIGEST_UNAVAILABLE if hashing is not possible.
     */
    static UUIDGenError v3(const NanoUUID& ns, const uint8_t* name, size_t len, NanoUUID& out) noexcept;
    static UUIDGenError v3(const NanoUUID& ns, const char* name, NanoUUID& out) noexcept;

    /** @brief v5: first 16 bytes of SHA-1(namespace || name). */
    static UUIDGenError v5(const NanoUUID& ns, const uint8_t* name, size_t len, NanoUUID& out) noexcept;
    static UUIDGenError v5(const NanoUUID& ns, const char* name, NanoUUID& out) noexcept;

    /**
     * @brief v7: 48-bit Unix ms, then rand_a (12 bits) and rand_b (62 bits).
     * Higher bits of each argument are discarded.
     */
    static NanoUUID v7(uint64_t unixMs, uint16_t randA, uint64_t randB) noexcept;

    /** @brief v8: caller bytes kept as-is apart from version and variant. */
    static NanoUUID v8(const uint8_t custom[16]) noexcept;

    // --- Default Platform Implementations ---
    static bool default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept;
    static uint64_t default_now_ms(void* ctx) noexcept;
    static bool default_node(uint8_t node[6], void* ctx) noexcept;

private:
    fill_random_fn _rng;
    void* _rng_ctx;
    now_ms_fn _now;
    void* _now_ctx;
    now_ticks_fn _ticks;
    void* _ticks_ctx;
    node_fn _node;
    void* _node_ctx;
    UUIDNodePolicy _nodePolicy;

    UUIDGenError _fillRandom(uint8_t* dest, size_t len) const noexcept;
    UUIDGenError _gregorianInputs(uint64_t& ticks, uint16_t& clockSeq, uint8_t node[6]) const noexcept;
};
