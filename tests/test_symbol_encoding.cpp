// tests/test_symbol_encoding.cpp
// Nucleotide mapping, decoding, and rejection of bytes outside the alphabet.

#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../src/symbol_encoding.hpp"

int main() {
    const std::string bases = "ACGT";
    for (size_t i = 0; i < bases.size(); ++i) {
        if (encode_symbol(static_cast<unsigned char>(bases[i])) != i) {
            std::cerr << "encode_symbol(" << bases[i] << ") expected " << i << "\n";
            return 2;
        }
        if (encode_symbol(static_cast<unsigned char>(std::tolower(bases[i]))) != i) {
            std::cerr << "lower-case " << bases[i] << " should share the upper-case code\n";
            return 3;
        }
        if (decode_symbol(static_cast<uint8_t>(i)) != bases[i]) {
            std::cerr << "decode_symbol(" << i << ") expected " << bases[i] << "\n";
            return 4;
        }
    }

    // every byte outside ACGTacgt is rejected
    int accepted = 0;
    for (int c = 0; c < 256; ++c) {
        if (is_symbol(static_cast<unsigned char>(c))) ++accepted;
    }
    if (accepted != 8) {
        std::cerr << "expected exactly 8 accepted bytes, got " << accepted << "\n";
        return 5;
    }

    const std::string bad = "N\n5 ";
    for (char c : bad) {
        bool threw = false;
        try {
            encode_symbol(static_cast<unsigned char>(c));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "encode_symbol accepted byte " << static_cast<int>(c) << "\n";
            return 6;
        }
    }

    EncodedSequence enc = encode_sequence("GATTACA");
    const EncodedSequence expected = {2, 0, 3, 3, 0, 1, 0};
    if (enc != expected) {
        std::cerr << "encode_sequence(GATTACA) mismatch\n";
        return 7;
    }
    if (encode_sequence(std::string()).size() != 0) {
        std::cerr << "empty input should encode to empty sequence\n";
        return 8;
    }

    // same text twice -> same codes
    const std::string text = "TTGCAACGTAGGCT";
    if (encode_sequence(text) != encode_sequence(text.data(), text.size())) {
        std::cerr << "encoding is not deterministic\n";
        return 9;
    }

    // whole-run rejection reports the offset of the first bad byte
    try {
        encode_sequence("ACGTNACGT");
        std::cerr << "encode_sequence accepted N\n";
        return 10;
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        if (msg.find("offset 4") == std::string::npos) {
            std::cerr << "error message lacks offset: " << msg << "\n";
            return 11;
        }
    }

    bool threw = false;
    try {
        decode_symbol(4);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "decode_symbol(4) should throw\n";
        return 12;
    }

    std::cout << "test_symbol_encoding: OK\n";
    return 0;
}
