#include "UUIDDigest.h"
#include <string.h>

#if defined(PLATFORMIO_ESP32) || defined(ARDUINO_ARCH_ESP32)
    #define NANOUUID_DIGEST_MBEDTLS
    #include "mbedtls/version.h"
    #include "mbedtls/md5.h"
    #include "mbedtls/sha1.h"
#elif !defined(ARDUINO)
    #define NANOUUID_DIGEST_OPENSSL
    #include <openssl/evp.h>
#endif

#if defined(NANOUUID_DIGEST_OPENSSL)

// RAII owner for an EVP digest context
class UUIDDigestContext {
public:
    UUIDDigestContext() : _ctx(EVP_MD_CTX_new()) {}
    ~UUIDDigestContext() { EVP_MD_CTX_free(_ctx); }

    UUIDDigestContext(const UUIDDigestContext&) = delete;
    UUIDDigestContext& operator=(const UUIDDigestContext&) = delete;

    EVP_MD_CTX* get() const { return _ctx; }

private:
    EVP_MD_CTX* _ctx;
};

bool uuid_digest(UUIDDigestAlgorithm alg, const uint8_t ns[16],
                 const uint8_t* name, size_t len, uint8_t out[16]) noexcept {
    if (len > 0 && !name) return false;

    UUIDDigestContext ctx;
    if (!ctx.get()) return false;

    const EVP_MD* md = (alg == UUID_DIGEST_MD5) ? EVP_md5() : EVP_sha1();
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) return false;
    if (EVP_DigestUpdate(ctx.get(), ns, 16) != 1) return false;
    if (len > 0 && EVP_DigestUpdate(ctx.get(), name, len) != 1) return false;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) return false;
    if (digest_len < 16) return false;

    memcpy(out, digest, 16);
    return true;
}

#elif defined(NANOUUID_DIGEST_MBEDTLS)

// mbedTLS 3 dropped the _ret suffix that 2.x used for the checked variants.
#if MBEDTLS_VERSION_MAJOR >= 3
    #define NANOUUID_MD5_STARTS  mbedtls_md5_starts
    #define NANOUUID_MD5_UPDATE  mbedtls_md5_update
    #define NANOUUID_MD5_FINISH  mbedtls_md5_finish
    #define NANOUUID_SHA1_STARTS mbedtls_sha1_starts
    #define NANOUUID_SHA1_UPDATE mbedtls_sha1_update
    #define NANOUUID_SHA1_FINISH mbedtls_sha1_finish
#else
    #define NANOUUID_MD5_STARTS  mbedtls_md5_starts_ret
    #define NANOUUID_MD5_UPDATE  mbedtls_md5_update_ret
    #define NANOUUID_MD5_FINISH  mbedtls_md5_finish_ret
    #define NANOUUID_SHA1_STARTS mbedtls_sha1_starts_ret
    #define NANOUUID_SHA1_UPDATE mbedtls_sha1_update_ret
    #define NANOUUID_SHA1_FINISH mbedtls_sha1_finish_ret
#endif

static bool digest_md5(const uint8_t ns[16], const uint8_t* name, size_t len, uint8_t out[16]) {
    mbedtls_md5_context ctx;
    mbedtls_md5_init(&ctx);
    bool ok = NANOUUID_MD5_STARTS(&ctx) == 0 &&
              NANOUUID_MD5_UPDATE(&ctx, ns, 16) == 0 &&
              (len == 0 || NANOUUID_MD5_UPDATE(&ctx, name, len) == 0) &&
              NANOUUID_MD5_FINISH(&ctx, out) == 0;
    mbedtls_md5_free(&ctx);
    return ok;
}

static bool digest_sha1(const uint8_t ns[16], const uint8_t* name, size_t len, uint8_t out[16]) {
    uint8_t digest[20];
    mbedtls_sha1_context ctx;
    mbedtls_sha1_init(&ctx);
    bool ok = NANOUUID_SHA1_STARTS(&ctx) == 0 &&
              NANOUUID_SHA1_UPDATE(&ctx, ns, 16) == 0 &&
              (len == 0 || NANOUUID_SHA1_UPDATE(&ctx, name, len) == 0) &&
              NANOUUID_SHA1_FINISH(&ctx, digest) == 0;
    mbedtls_sha1_free(&ctx);
    if (ok) memcpy(out, digest, 16);
    return ok;
}

bool uuid_digest(UUIDDigestAlgorithm alg, const uint8_t ns[16],
                 const uint8_t* name, size_t len, uint8_t out[16]) noexcept {
    if (len > 0 && !name) return false;
    return (alg == UUID_DIGEST_MD5) ? digest_md5(ns, name, len, out)
                                    : digest_sha1(ns, name, len, out);
}

#else

#warning "NanoUUID: No MD5/SHA-1 backend on this platform. v3/v5 generation will report UUID_GEN_DIGEST_UNAVAILABLE."

bool uuid_digest(UUIDDigestAlgorithm alg, const uint8_t ns[16],
                 const uint8_t* name, size_t len, uint8_t out[16]) noexcept {
    (void)alg; (void)ns; (void)name; (void)len; (void)out;
    return false;
}

#endif
