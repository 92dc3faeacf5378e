// Default Entropy / Clock / Node providers, one branch per platform.
// Any of them can be replaced through the UUIDGenerator constructor and setters.

#include "UUIDGenerator.h"
#include <string.h>

#if defined(ARDUINO)
    #include <Arduino.h>
#endif

#if defined(NANOUUID_NO_DEFAULT_PROVIDERS)
    // Injection only.
#elif defined(PLATFORMIO_ESP32) || defined(ARDUINO_ARCH_ESP32)
    #include "esp_system.h"
    #include <sys/time.h>
#elif defined(PLATFORMIO_ESP8266) || defined(ESP8266)
    #include <sys/time.h>
    extern "C" {
      #include "user_interface.h"
    }
#elif defined(ARDUINO_ARCH_RP2040)
    #include <hardware/structs/rosc.h>
#elif defined(ARDUINO_ARCH_AVR) || defined(__AVR__)
    #include <util/atomic.h>
    #ifndef NANOUUID_NO_ANALOG_ENTROPY
        #ifndef NANOUUID_ENTROPY_ANALOG_PIN
            #define NANOUUID_ENTROPY_ANALOG_PIN A0
        #endif
    #endif
#elif !defined(ARDUINO)
    #define NANOUUID_HOSTED
    #include <chrono>
    #include <climits>
    #include <openssl/rand.h>
#endif

// --- INTERNAL HELPERS ---

#if (defined(PLATFORMIO_ESP32) || defined(ARDUINO_ARCH_ESP32) || \
     defined(PLATFORMIO_ESP8266) || defined(ESP8266)) && !defined(NANOUUID_NO_DEFAULT_PROVIDERS)
// Wall clock set by SNTP or an RTC; reads before NANOUUID_MIN_VALID_UNIX_MS mean "not set yet".
static uint64_t wall_clock_ms() {
    struct timeval tv;
    if (gettimeofday(&tv, nullptr) != 0) return 0;
    uint64_t ms = (uint64_t)tv.tv_sec * 1000ULL + (uint64_t)(tv.tv_usec / 1000);
    return (ms < NANOUUID_MIN_VALID_UNIX_MS) ? 0 : ms;
}
#endif

#if (defined(ARDUINO_ARCH_AVR) || defined(__AVR__)) && !defined(NANOUUID_NO_DEFAULT_PROVIDERS)
static inline uint32_t mix32(uint32_t k) {
    k ^= k >> 16;
    k *= 0x85ebca6b;
    k ^= k >> 13;
    k *= 0xc2b2ae35;
    k ^= k >> 16;
    return k;
}

static uint32_t xorshift32(uint32_t* state) {
    uint32_t x = *state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    *state = x;
    return x;
}

// One-time seed from ADC noise and timer jitter.
static uint32_t avr_seed() {
    uint32_t entropy = 0;
    uint8_t stack_var;
    entropy ^= mix32((uint16_t)(uintptr_t)&stack_var);
    entropy ^= mix32(micros());

    #ifdef NANOUUID_ENTROPY_ANALOG_PIN
        for (int i = 0; i < 8; i++) {
            unsigned long t_start = micros();
            uint16_t val = analogRead(NANOUUID_ENTROPY_ANALOG_PIN);
            unsigned long t_end = micros();
            entropy = mix32(entropy ^ val);
            entropy = mix32(entropy ^ (uint32_t)(t_end - t_start));
            delayMicroseconds(10 + (val & 0x0F));
        }
    #endif

    return entropy ? entropy : 0xBADC0FFE;
}
#endif

// --- DEFAULT PROVIDERS ---

bool UUIDGenerator::default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept {
    (void)ctx;
    if (!dest) return false;

#if defined(NANOUUID_NO_DEFAULT_PROVIDERS)
    (void)len;
    return false;

#elif defined(PLATFORMIO_ESP32) || defined(ARDUINO_ARCH_ESP32)
    // Hardware RNG; true random once the RF subsystem or bootloader entropy is up.
    size_t i = 0;
    while (i < len) {
        uint32_t r = esp_random();
        for (int k = 0; k < 4 && i < len; k++) {
            dest[i++] = (uint8_t)(r & 0xFF);
            r >>= 8;
        }
    }
    return true;

#elif defined(PLATFORMIO_ESP8266) || defined(ESP8266)
    return os_get_random((unsigned char*)dest, len) == 0;

#elif defined(ARDUINO_ARCH_RP2040)
    // Ring oscillator jitter, one bit per read.
    for (size_t i = 0; i < len; i++) {
        uint8_t r = 0;
        for (int bit = 0; bit < 8; bit++) {
            r = (uint8_t)((r << 1) | (rosc_hw->randombit & 1));
        }
        dest[i] = r;
    }
    return true;

#elif defined(ARDUINO_ARCH_AVR) || defined(__AVR__)
    #warning "NanoUUID: Using fallback entropy (ADC noise + Clock Jitter). Not cryptographically secure."

    static uint32_t rng_state = 0;
    ATOMIC_BLOCK(ATOMIC_RESTORESTATE) {
        if (rng_state == 0) rng_state = avr_seed();
        size_t i = 0;
        while (i < len) {
            rng_state ^= (uint32_t)micros();
            uint32_t r = xorshift32(&rng_state);
            for (int b = 0; b < 4 && i < len; b++) {
                dest[i++] = (uint8_t)(r & 0xFF);
                r >>= 8;
            }
        }
    }
    return true;

#elif defined(NANOUUID_HOSTED)
    while (len > 0) {
        int chunk = (len > (size_t)INT_MAX) ? INT_MAX : (int)len;
        if (RAND_bytes(dest, chunk) != 1) return false;
        dest += chunk;
        len -= (size_t)chunk;
    }
    return true;

#else
    // Unknown board (STM32, SAMD, ...): report entropy as unavailable instead of guessing.
    #warning "NanoUUID: No default entropy source for this board. Inject an RNG via the UUIDGenerator constructor, or generation reports UUID_GEN_ENTROPY_UNAVAILABLE."
    (void)len;
    return false;
#endif
}

uint64_t UUIDGenerator::default_now_ms(void* ctx) noexcept {
    (void)ctx;
#if defined(NANOUUID_NO_DEFAULT_PROVIDERS)
    return 0;
#elif defined(PLATFORMIO_ESP32) || defined(ARDUINO_ARCH_ESP32) || defined(PLATFORMIO_ESP8266) || defined(ESP8266)
    return wall_clock_ms();
#elif defined(NANOUUID_HOSTED)
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
#else
    // millis() is uptime, not Unix time. Inject an RTC-backed source instead.
    return 0;
#endif
}

bool UUIDGenerator::default_node(uint8_t node[6], void* ctx) noexcept {
    (void)ctx;
    if (!node) return false;

#if defined(NANOUUID_NO_DEFAULT_PROVIDERS)
    return false;
#elif defined(PLATFORMIO_ESP32) || defined(ARDUINO_ARCH_ESP32)
    // Factory-programmed base MAC, stored LSB first.
    uint64_t mac = ESP.getEfuseMac();
    for (int i = 0; i < 6; i++) {
        node[i] = (uint8_t)(mac & 0xFF);
        mac >>= 8;
    }
    return true;
#elif defined(PLATFORMIO_ESP8266) || defined(ESP8266)
    return wifi_get_macaddr(STATION_IF, node);
#else
    // No portable hardware address. Callers choose a source or UUID_NODE_RANDOM_FALLBACK.
    return false;
#endif
}
