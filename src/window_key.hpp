/**
 * @file window_key.hpp
 * @brief Packing of L consecutive 2-bit codes into one 64-bit key
 *
 * The first code of the window lands in the most significant used bits,
 * so a window "ACGT" packs to 0b00011011.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "symbol_encoding.hpp"

using WindowKey = uint64_t;

static constexpr size_t MAX_WINDOW_LENGTH = 32;  // 2 bits per symbol in 64 bits

// ============================================================================
// ROLLING WINDOW KEY
// ============================================================================

class WindowKeyPacker {
private:
    size_t length_;
    WindowKey mask_;
    WindowKey key_;
    size_t symbols_in_window_;

public:
    /**
     * @throws std::invalid_argument if length is 0 or does not fit in a key
     */
    explicit WindowKeyPacker(size_t length);

    void reset() {
        key_ = 0;
        symbols_in_window_ = 0;
    }

    /**
     * @brief Slide one code into the window
     * @return true once the window holds L codes (and on every call after)
     *
     * O(1): shift left by one symbol, or in the new code, and drop the
     * symbol that fell off the top.
     */
    bool push(uint8_t code) {
        key_ = ((key_ << 2) | (code & 3)) & mask_;
        if (symbols_in_window_ < length_) {
            ++symbols_in_window_;
        }
        return symbols_in_window_ == length_;
    }

    WindowKey key() const { return key_; }
    bool full() const { return symbols_in_window_ == length_; }
    WindowKey mask() const { return mask_; }
};

/**
 * @brief Key mask for a window length (all ones in the low 2*L bits)
 */
inline WindowKey window_mask(size_t length) {
    return (2 * length >= 64) ? ~0ULL : ((1ULL << (2 * length)) - 1);
}

/**
 * @brief Fold L codes from zero, O(L). Used for queries and as the reference
 * against which the rolling packer is checked.
 */
WindowKey pack_window(const uint8_t* codes, size_t length);
WindowKey pack_window(const EncodedSequence& codes, size_t offset, size_t length);

/**
 * @brief Key of an unencoded window such as a query string
 * @throws std::runtime_error on non-alphabet bytes, std::invalid_argument on bad length
 */
WindowKey key_of(const std::string& window);

std::string unpack_window(WindowKey key, size_t length);
