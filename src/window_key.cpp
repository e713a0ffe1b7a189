#include "window_key.hpp"

#include <stdexcept>

namespace {

void check_length(size_t length) {
    if (length == 0) {
        throw std::invalid_argument("Window length must be at least 1");
    }
    if (length > MAX_WINDOW_LENGTH) {
        throw std::invalid_argument("Window length " + std::to_string(length) +
                                    " needs " + std::to_string(2 * length) +
                                    " bits; keys hold at most 64 (L <= " +
                                    std::to_string(MAX_WINDOW_LENGTH) + ")");
    }
}

}  // namespace

WindowKeyPacker::WindowKeyPacker(size_t length)
    : length_(length), mask_(0), key_(0), symbols_in_window_(0) {
    check_length(length);
    mask_ = window_mask(length);
}

WindowKey pack_window(const uint8_t* codes, size_t length) {
    check_length(length);
    WindowKey key = 0;
    for (size_t i = 0; i < length; ++i) {
        key = (key << 2) | (codes[i] & 3);
    }
    return key;
}

WindowKey pack_window(const EncodedSequence& codes, size_t offset, size_t length) {
    if (offset > codes.size() || codes.size() - offset < length) {
        throw std::out_of_range("Window at offset " + std::to_string(offset) +
                                " runs past the end of the sequence");
    }
    return pack_window(codes.data() + offset, length);
}

WindowKey key_of(const std::string& window) {
    EncodedSequence codes = encode_sequence(window);
    return pack_window(codes.data(), codes.size());
}

std::string unpack_window(WindowKey key, size_t length) {
    check_length(length);
    std::string result(length, 'A');
    for (size_t i = 0; i < length; ++i) {
        size_t shift = 2 * (length - 1 - i);
        result[i] = BASE_DECODING[(key >> shift) & 3];
    }
    return result;
}
