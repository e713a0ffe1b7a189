/**
 * @file symbol_encoding.hpp
 * @brief Nucleotide to 2-bit code mapping
 *
 * A(0) C(1) G(2) T(3). Lower-case letters are accepted as aliases.
 * Every other byte is outside the alphabet and is rejected.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

using EncodedSequence = std::vector<uint8_t>;

// ============================================================================
// CONSTANTS AND LOOKUP TABLES
// ============================================================================

static constexpr int8_t BASE_ENCODING[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1,  0, -1,  1, -1, -1, -1,  2, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1,  3, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1,  0, -1,  1, -1, -1, -1,  2, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1,  3, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1
};

static constexpr char BASE_DECODING[4] = {'A', 'C', 'G', 'T'};

inline bool is_symbol(unsigned char c) {
    return BASE_ENCODING[c] >= 0;
}

/**
 * @brief Map one alphabet byte to its 2-bit code
 * @throws std::invalid_argument if the byte is not A/C/G/T (any case)
 */
uint8_t encode_symbol(unsigned char c);

/**
 * @brief Inverse of encode_symbol, always upper case
 * @throws std::invalid_argument if code > 3
 */
char decode_symbol(uint8_t code);

/**
 * @brief Encode a whole byte stream, one code per byte
 *
 * The stream must already be free of framing (newlines, headers).
 * Fails on the first byte outside the alphabet and reports its offset;
 * no partial result is returned.
 */
EncodedSequence encode_sequence(const char* data, size_t length);
EncodedSequence encode_sequence(const std::string& text);
