#ifdef STANDALONE_TEST
    #include <assert.h>
    #include <stdio.h>
    #include <string.h>
    #define TEST_ASSERT_TRUE(cond) assert(cond)
    #define TEST_ASSERT_FALSE(cond) assert(!(cond))
    #define TEST_ASSERT_EQUAL_INT(expected, actual) assert((expected) == (actual))
    #define TEST_ASSERT_EQUAL_UINT8(expected, actual) assert((expected) == (actual))
    #define TEST_ASSERT_EQUAL_UINT16(expected, actual) assert((expected) == (actual))
    #define TEST_ASSERT_EQUAL_UINT32(expected, actual) assert((expected) == (actual))
    #define TEST_ASSERT_EQUAL_MEMORY(expected, actual, len) assert(memcmp(expected, actual, len) == 0)
    #define TEST_ASSERT_EQUAL_STRING(expected, actual) assert(strcmp(expected, actual) == 0)
    #define RUN_TEST(func) do { printf("Running %s...", #func); func(); printf(" OK\n"); } while(0)
    #define UNITY_BEGIN() printf("Starting Standalone Tests...\n")
    #define UNITY_END() (printf("All tests passed!\n"), 0)
#else
    #include <unity.h>
    #include <string.h>
    void setUp(void) {}
    void tearDown(void) {}
#endif

#if !defined(ARDUINO)
    #include <sstream>
    // Same function-like macros the AVR core's Arduino.h defines.
    #ifndef max
        #define max(a,b) ((a)>(b)?(a):(b))
    #endif
    #ifndef min
        #define min(a,b) ((a)<(b)?(a):(b))
    #endif
#endif

#include "NanoUUID.h"
#include "UUIDBits.h"

// RFC 9562 Appendix A.1
static const uint8_t kV1Vector[16] = {
    0xC2, 0x32, 0xAB, 0x00, 0x94, 0x14, 0x11, 0xEC,
    0xB3, 0xC8, 0x9F, 0x6B, 0xDE, 0xCE, 0xD8, 0x46
};

// RFC 9562 Appendix A.5 (same time, clock sequence and node as A.1)
static const uint8_t kV6Vector[16] = {
    0x1E, 0xC9, 0x41, 0x4C, 0x23, 0x2A, 0x6B, 0x00,
    0xB3, 0xC8, 0x9F, 0x6B, 0xDE, 0xCE, 0xD8, 0x46
};

// RFC 9562 Appendix A.6
static const uint8_t kV7Vector[16] = {
    0x01, 0x7F, 0x22, 0xE2, 0x79, 0xB0, 0x7C, 0xC3,
    0x98, 0xC4, 0xDC, 0x0C, 0x0C, 0x07, 0x39, 0x8F
};

// 662aa7c7-7598-4d56-8bcc-a72c30f998a2
static const uint8_t kV4Raw[16] = {
    0x66, 0x2A, 0xA7, 0xC7, 0x75, 0x98, 0x4D, 0x56,
    0x8B, 0xCC, 0xA7, 0x2C, 0x30, 0xF9, 0x98, 0xA2
};

static const uint64_t kVectorTicks = 138648505420000000ULL; // 2022-02-22 19:22:22 UTC

// --- TEST CASES ---

void test_bytes_are_kept_verbatim() {
    uint8_t raw[16];
    uint32_t s = 0x12345678U;

    for (int round = 0; round < 64; round++) {
        for (int i = 0; i < 16; i++) {
            s = 1664525U * s + 1013904223U;
            raw[i] = (uint8_t)(s >> 24);
        }
        NanoUUID u(raw);
        TEST_ASSERT_EQUAL_MEMORY(raw, u.data(), 16);
        TEST_ASSERT_TRUE(NanoUUID::fromBytes(raw) == u);

        uint8_t copy[16];
        u.toBytes(copy);
        TEST_ASSERT_EQUAL_MEMORY(raw, copy, 16);
    }
}

void test_nil_and_max() {
    NanoUUID nil;
    TEST_ASSERT_TRUE(nil.isNil());
    TEST_ASSERT_FALSE(nil.isMax());
    TEST_ASSERT_TRUE(nil == NanoUUID::nil());
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_NIL, nil.version());
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_NCS, nil.variant());

    NanoUUID ones = NanoUUID::maxValue();
    TEST_ASSERT_TRUE(ones.isMax());
    TEST_ASSERT_FALSE(ones.isNil());
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_MAX, ones.version());
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_FUTURE, ones.variant());
    for (int i = 0; i < 16; i++) TEST_ASSERT_EQUAL_UINT8(0xFF, ones.data()[i]);
}

void test_version_for_every_nibble() {
    uint8_t raw[16];
    memset(raw, 0x5A, sizeof(raw));

    for (int nibble = 0; nibble < 16; nibble++) {
        raw[6] = (uint8_t)((nibble << 4) | 0x0A);
        UUIDVersion v = NanoUUID(raw).version();
        if (nibble >= 1 && nibble <= 8) {
            TEST_ASSERT_EQUAL_INT(nibble, v);
        } else {
            TEST_ASSERT_EQUAL_INT(UUID_VERSION_RESERVED, v);
        }
    }

    // Nibble 0 alone is not Nil, nibble 15 alone is not Max.
    memset(raw, 0, sizeof(raw));
    raw[15] = 0x01;
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_RESERVED, NanoUUID(raw).version());
    memset(raw, 0xFF, sizeof(raw));
    raw[0] = 0xFE;
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_RESERVED, NanoUUID(raw).version());
}

void test_variant_for_every_byte() {
    uint8_t raw[16];
    memset(raw, 0x11, sizeof(raw));

    for (int b = 0; b < 256; b++) {
        raw[8] = (uint8_t)b;
        UUIDVariant v = NanoUUID(raw).variant();
        if ((b & 0x80) == 0) {
            TEST_ASSERT_EQUAL_INT(UUID_VARIANT_NCS, v);
        } else if ((b & 0xC0) == 0x80) {
            TEST_ASSERT_EQUAL_INT(UUID_VARIANT_RFC, v);
        } else if ((b & 0xE0) == 0xC0) {
            TEST_ASSERT_EQUAL_INT(UUID_VARIANT_MICROSOFT, v);
        } else {
            TEST_ASSERT_EQUAL_INT(UUID_VARIANT_FUTURE, v);
        }
    }
}

void test_field_accessors() {
    NanoUUID u(kV1Vector);
    TEST_ASSERT_EQUAL_UINT32(0xC232AB00UL, u.timeLow());
    TEST_ASSERT_EQUAL_UINT16(0x9414, u.timeMid());
    TEST_ASSERT_EQUAL_UINT16(0x11EC, u.timeHiAndVersion());
    TEST_ASSERT_EQUAL_UINT8(0xB3, u.clockSeqHiAndReserved());
    TEST_ASSERT_EQUAL_UINT8(0xC8, u.clockSeqLow());

    uint8_t node[6];
    u.node(node);
    TEST_ASSERT_EQUAL_MEMORY("\x9F\x6B\xDE\xCE\xD8\x46", node, 6);
}

void test_gregorian_ticks_v1_and_v6() {
    NanoUUID v1(kV1Vector);
    NanoUUID v6(kV6Vector);
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_1, v1.version());
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_6, v6.version());

    uint64_t t1 = 0, t6 = 0;
    TEST_ASSERT_TRUE(v1.gregorianTicks(t1));
    TEST_ASSERT_TRUE(v6.gregorianTicks(t6));
    TEST_ASSERT_TRUE(t1 == kVectorTicks);
    TEST_ASSERT_TRUE(t6 == kVectorTicks);

    uint16_t s1 = 0, s6 = 0;
    TEST_ASSERT_TRUE(v1.clockSequence(s1));
    TEST_ASSERT_TRUE(v6.clockSequence(s6));
    TEST_ASSERT_EQUAL_UINT16(0x33C8, s1);
    TEST_ASSERT_EQUAL_UINT16(0x33C8, s6);
}

void test_unix_timestamp() {
    uint64_t ms = 0;
    TEST_ASSERT_TRUE(NanoUUID(kV7Vector).unixTimestampMs(ms));
    TEST_ASSERT_TRUE(ms == 0x017F22E279B0ULL);

    TEST_ASSERT_TRUE(NanoUUID(kV1Vector).unixTimestampMs(ms));
    TEST_ASSERT_TRUE(ms == 1645557742000ULL);
    TEST_ASSERT_TRUE(NanoUUID(kV6Vector).unixTimestampMs(ms));
    TEST_ASSERT_TRUE(ms == 1645557742000ULL);

    // v1 tick count of zero predates the Unix epoch
    uint8_t early[16];
    memset(early, 0, sizeof(early));
    early[6] = 0x10;
    early[8] = 0x80;
    TEST_ASSERT_FALSE(NanoUUID(early).unixTimestampMs(ms));
}

void test_time_fields_need_matching_version_and_variant() {
    uint64_t ticks;
    uint64_t ms;
    uint16_t seq;

    NanoUUID v4(kV4Raw);
    TEST_ASSERT_FALSE(v4.gregorianTicks(ticks));
    TEST_ASSERT_FALSE(v4.unixTimestampMs(ms));
    TEST_ASSERT_FALSE(v4.clockSequence(seq));
    TEST_ASSERT_FALSE(NanoUUID::nil().gregorianTicks(ticks));
    TEST_ASSERT_FALSE(NanoUUID::maxValue().unixTimestampMs(ms));

    // Version nibble 1 under the Microsoft variant is not an RFC time value.
    uint8_t raw[16];
    memcpy(raw, kV1Vector, 16);
    raw[8] = 0xC3;
    TEST_ASSERT_FALSE(NanoUUID(raw).gregorianTicks(ticks));
    TEST_ASSERT_FALSE(NanoUUID(raw).clockSequence(seq));
}

void test_mixed_endian_bytes() {
    // Partition GUID as stored on disk: 20169084-b186-884f-...
    const uint8_t disk[16] = {
        0x20, 0x16, 0x90, 0x84, 0xB1, 0x86, 0x88, 0x4F,
        0xB1, 0x10, 0x3D, 0xB2, 0xC3, 0x7E, 0xB8, 0xB5
    };

    NanoUUID wrong(disk);
    NanoUUID right = NanoUUID::fromBytesMixedEndian(disk);
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_8, wrong.version());
    TEST_ASSERT_EQUAL_INT(UUID_VERSION_4, right.version());
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_RFC, right.variant());

    const uint8_t network[16] = {
        0x84, 0x90, 0x16, 0x20, 0x86, 0xB1, 0x4F, 0x88,
        0xB1, 0x10, 0x3D, 0xB2, 0xC3, 0x7E, 0xB8, 0xB5
    };
    TEST_ASSERT_EQUAL_MEMORY(network, right.data(), 16);

    uint8_t back[16];
    right.toBytesMixedEndian(back);
    TEST_ASSERT_EQUAL_MEMORY(disk, back, 16);
}

void test_operators() {
    NanoUUID a(kV6Vector);
    NanoUUID b(kV7Vector);

    TEST_ASSERT_TRUE(a == a);
    TEST_ASSERT_TRUE(a != b);
    TEST_ASSERT_TRUE(b < a);
    TEST_ASSERT_FALSE(a < b);
    TEST_ASSERT_TRUE(NanoUUID::nil() < NanoUUID::maxValue());

    NanoUUID copy = a;
    TEST_ASSERT_TRUE(copy == a);
}

void test_namespace_constants() {
    TEST_ASSERT_EQUAL_MEMORY("\x6b\xa7\xb8\x10\x9d\xad\x11\xd1\x80\xb4\x00\xc0\x4f\xd4\x30\xc8",
                             NanoUUID::namespaceDns().data(), 16);
    TEST_ASSERT_EQUAL_UINT8(0x11, NanoUUID::namespaceUrl().data()[3]);
    TEST_ASSERT_EQUAL_UINT8(0x12, NanoUUID::namespaceOid().data()[3]);
    TEST_ASSERT_EQUAL_UINT8(0x14, NanoUUID::namespaceX500().data()[3]);

    TEST_ASSERT_EQUAL_INT(UUID_VERSION_1, NanoUUID::namespaceX500().version());
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_RFC, NanoUUID::namespaceX500().variant());
}

// Namespace-scope initializers run before main(), in no fixed order relative to other files.
static const bool kDnsNilAtStartup = NanoUUID::namespaceDns().isNil();
static const NanoUUID kUrlAtStartup = NanoUUID::namespaceUrl();

void test_namespaces_during_static_init() {
    TEST_ASSERT_FALSE(kDnsNilAtStartup);
    TEST_ASSERT_TRUE(kUrlAtStartup == NanoUUID::namespaceUrl());
    TEST_ASSERT_EQUAL_UINT8(0x11, kUrlAtStartup.data()[3]);
}

void test_set_variant_keeps_payload_bits() {
    uint8_t b[16];

    memset(b, 0xFF, sizeof(b));
    uuid_set_variant(b, UUID_VARIANT_NCS);
    TEST_ASSERT_EQUAL_UINT8(0x7F, b[8]);
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_NCS, NanoUUID(b).variant());

    memset(b, 0xFF, sizeof(b));
    uuid_set_variant(b, UUID_VARIANT_RFC);
    TEST_ASSERT_EQUAL_UINT8(0xBF, b[8]);
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_RFC, NanoUUID(b).variant());

    memset(b, 0xFF, sizeof(b));
    uuid_set_variant(b, UUID_VARIANT_MICROSOFT);
    TEST_ASSERT_EQUAL_UINT8(0xDF, b[8]);
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_MICROSOFT, NanoUUID(b).variant());

    memset(b, 0x00, sizeof(b));
    b[0] = 0x01;
    uuid_set_variant(b, UUID_VARIANT_FUTURE);
    TEST_ASSERT_EQUAL_UINT8(0xE0, b[8]);
    TEST_ASSERT_EQUAL_INT(UUID_VARIANT_FUTURE, NanoUUID(b).variant());

    // Only byte 8 is touched
    for (int i = 1; i < 16; i++) {
        if (i != 8) TEST_ASSERT_EQUAL_UINT8(0x00, b[i]);
    }
}

void test_set_version_ignores_unassignable() {
    uint8_t b[16];
    memset(b, 0xAA, sizeof(b));

    uuid_set_version(b, UUID_VERSION_NIL);
    uuid_set_version(b, UUID_VERSION_MAX);
    uuid_set_version(b, UUID_VERSION_RESERVED);
    TEST_ASSERT_EQUAL_UINT8(0xAA, b[6]);

    uuid_set_version(b, UUID_VERSION_8);
    TEST_ASSERT_EQUAL_UINT8(0x8A, b[6]);
    uuid_set_version(b, UUID_VERSION_1);
    TEST_ASSERT_EQUAL_UINT8(0x1A, b[6]);
}

void test_diagnostic_names() {
    TEST_ASSERT_EQUAL_STRING("v4", uuidVersionName(UUID_VERSION_4));
    TEST_ASSERT_EQUAL_STRING("Nil", uuidVersionName(UUID_VERSION_NIL));
    TEST_ASSERT_EQUAL_STRING("Reserved", uuidVersionName(UUID_VERSION_RESERVED));
    TEST_ASSERT_EQUAL_STRING("RFC 9562", uuidVariantName(UUID_VARIANT_RFC));
    TEST_ASSERT_EQUAL_STRING("Future", uuidVariantName(UUID_VARIANT_FUTURE));
}

#if !defined(ARDUINO)
void test_ostream_operator() {
    std::stringstream ss;
    ss << NanoUUID(kV4Raw);
    TEST_ASSERT_EQUAL_STRING("662aa7c7-7598-4d56-8bcc-a72c30f998a2", ss.str().c_str());
}
#endif

// --- TEST RUNNER ---

int run_tests() {
    UNITY_BEGIN();
    RUN_TEST(test_bytes_are_kept_verbatim);
    RUN_TEST(test_nil_and_max);
    RUN_TEST(test_version_for_every_nibble);
    RUN_TEST(test_variant_for_every_byte);
    RUN_TEST(test_field_accessors);
    RUN_TEST(test_gregorian_ticks_v1_and_v6);
    RUN_TEST(test_unix_timestamp);
    RUN_TEST(test_time_fields_need_matching_version_and_variant);
    RUN_TEST(test_mixed_endian_bytes);
    RUN_TEST(test_operators);
    RUN_TEST(test_namespace_constants);
    RUN_TEST(test_namespaces_during_static_init);
    RUN_TEST(test_set_variant_keeps_payload_bits);
    RUN_TEST(test_set_version_ignores_unassignable);
    RUN_TEST(test_diagnostic_names);
#if !defined(ARDUINO)
    RUN_TEST(test_ostream_operator);
#endif
    return UNITY_END();
}

// --- TEST EXECUTION ENTRY POINTS ---

#if defined(ARDUINO)
    void setup() {
        delay(2000);
        run_tests();
    }
    void loop() {}
#else
    int main(int argc, char **argv) {
        (void)argc; (void)argv;
        return run_tests();
    }
#endif
