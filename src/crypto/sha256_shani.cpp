// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// SHA-256 compression using the Intel SHA extensions.
//
// The SHA-NI round instruction works on the state split into the register
// pair ABEF / CDGH and consumes two rounds per call, taking the two
// (W + K) words from the low half of its message operand.  Message words
// are kept as four 128-bit vectors of four words each and advanced with
// sha256msg1 / sha256msg2.

#include "crypto/sha256.h"

#include <stdexcept>

#if (defined(__x86_64__) || defined(__i386__)) && \
    (defined(__GNUC__) || defined(__clang__))
#define FSG_HAVE_X86_SHANI 1
#include <cpuid.h>
#include <immintrin.h>
#endif

namespace crypto::detail {

#if defined(FSG_HAVE_X86_SHANI)

bool sha256_shani_supported() noexcept {
    unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;

    if (!__get_cpuid(1, &eax, &ebx, &ecx, &edx)) {
        return false;
    }
    const bool ssse3  = (ecx & (1u << 9)) != 0;
    const bool sse41  = (ecx & (1u << 19)) != 0;

    if (!__get_cpuid_count(7, 0, &eax, &ebx, &ecx, &edx)) {
        return false;
    }
    const bool sha = (ebx & (1u << 29)) != 0;

    return ssse3 && sse41 && sha;
}

__attribute__((target("sha,sse4.1")))
void sha256_compress_shani(Sha256State& state, const uint8_t* blocks,
                           size_t n_blocks) {
    // Byte-swap each 32-bit lane: message words are big-endian.
    const __m128i BSWAP_MASK =
        _mm_set_epi64x(0x0c0d0e0f08090a0bULL, 0x0405060700010203ULL);

    // state = {a,b,c,d} {e,f,g,h}  ->  STATE0 = ABEF, STATE1 = CDGH
    __m128i tmp    = _mm_loadu_si128(
        reinterpret_cast<const __m128i*>(&state[0]));
    __m128i state1 = _mm_loadu_si128(
        reinterpret_cast<const __m128i*>(&state[4]));
    tmp    = _mm_shuffle_epi32(tmp, 0xB1);          // CDAB
    state1 = _mm_shuffle_epi32(state1, 0x1B);       // EFGH
    __m128i state0 = _mm_alignr_epi8(tmp, state1, 8);  // ABEF
    state1 = _mm_blend_epi16(state1, tmp, 0xF0);       // CDGH

    const uint32_t* k = SHA256_ROUND_CONSTANTS.data();

    for (size_t blk = 0; blk < n_blocks; ++blk) {
        const uint8_t* block = blocks + blk * SHA256_BLOCK_SIZE;
        const __m128i abef_save = state0;
        const __m128i cdgh_save = state1;

        // msg[j & 3] holds W[4j .. 4j+3] for the current group j.
        __m128i msg[4];

        for (int g = 0; g < 16; ++g) {
            if (g < 4) {
                msg[g] = _mm_shuffle_epi8(
                    _mm_loadu_si128(reinterpret_cast<const __m128i*>(
                        block + 16 * g)),
                    BSWAP_MASK);
            }
            const __m128i cur = msg[g & 3];

            __m128i wk = _mm_add_epi32(
                cur, _mm_loadu_si128(
                         reinterpret_cast<const __m128i*>(k + 4 * g)));
            state1 = _mm_sha256rnds2_epu32(state1, state0, wk);

            // Finish W[4(g+1) .. 4(g+1)+3]: add W[t-7] and apply sigma1.
            if (g >= 3 && g <= 14) {
                __m128i& next = msg[(g + 1) & 3];
                __m128i w7 = _mm_alignr_epi8(cur, msg[(g - 1) & 3], 4);
                next = _mm_add_epi32(next, w7);
                next = _mm_sha256msg2_epu32(next, cur);
            }

            wk = _mm_shuffle_epi32(wk, 0x0E);
            state0 = _mm_sha256rnds2_epu32(state0, state1, wk);

            // Start W[4(g+3) .. 4(g+3)+3]: W[t-16] + sigma0(W[t-15]).
            if (g >= 1 && g <= 12) {
                __m128i& prev = msg[(g - 1) & 3];
                prev = _mm_sha256msg1_epu32(prev, cur);
            }
        }

        state0 = _mm_add_epi32(state0, abef_save);
        state1 = _mm_add_epi32(state1, cdgh_save);
    }

    // ABEF / CDGH  ->  {a,b,c,d} {e,f,g,h}
    tmp    = _mm_shuffle_epi32(state0, 0x1B);       // FEBA
    state1 = _mm_shuffle_epi32(state1, 0xB1);       // DCHG
    state0 = _mm_blend_epi16(tmp, state1, 0xF0);    // DCBA
    state1 = _mm_alignr_epi8(state1, tmp, 8);       // ABEF

    _mm_storeu_si128(reinterpret_cast<__m128i*>(&state[0]), state0);
    _mm_storeu_si128(reinterpret_cast<__m128i*>(&state[4]), state1);
}

#else  // !FSG_HAVE_X86_SHANI

bool sha256_shani_supported() noexcept {
    return false;
}

void sha256_compress_shani(Sha256State&, const uint8_t*, size_t) {
    throw std::logic_error(
        "sha256_compress_shani: SHA extensions not built for this target");
}

#endif

}  // namespace crypto::detail
