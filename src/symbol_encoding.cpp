#include "symbol_encoding.hpp"

#include <stdexcept>

namespace {

std::string describe_byte(unsigned char c) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string desc = "0x";
    desc += HEX[c >> 4];
    desc += HEX[c & 15];
    if (c >= 0x20 && c < 0x7f) {
        desc += " '";
        desc += static_cast<char>(c);
        desc += "'";
    }
    return desc;
}

}  // namespace

uint8_t encode_symbol(unsigned char c) {
    int8_t code = BASE_ENCODING[c];
    if (code < 0) {
        throw std::invalid_argument("Not a nucleotide: " + describe_byte(c));
    }
    return static_cast<uint8_t>(code);
}

char decode_symbol(uint8_t code) {
    if (code > 3) {
        throw std::invalid_argument("Invalid 2-bit code: " + std::to_string(code));
    }
    return BASE_DECODING[code];
}

EncodedSequence encode_sequence(const char* data, size_t length) {
    EncodedSequence encoded(length);
    for (size_t i = 0; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        int8_t code = BASE_ENCODING[c];
        if (code < 0) {
            throw std::runtime_error("Invalid symbol " + describe_byte(c) +
                                     " at offset " + std::to_string(i));
        }
        encoded[i] = static_cast<uint8_t>(code);
    }
    return encoded;
}

EncodedSequence encode_sequence(const std::string& text) {
    return encode_sequence(text.data(), text.size());
}
