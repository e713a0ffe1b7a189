#include "sequence_scanner.hpp"

#include <stdexcept>

#include "window_key.hpp"

size_t count_into(const EncodedSequence& encoded, size_t length, HashCounter& counter) {
    WindowKeyPacker window(length);
    size_t windows = 0;
    for (uint8_t code : encoded) {
        if (window.push(code)) {
            counter.increment(window.key());
            ++windows;
        }
    }
    return windows;
}

size_t count_records(const EncodedSequence& encoded, const std::vector<size_t>& record_ends,
                     size_t length, HashCounter& counter) {
    size_t previous = 0;
    for (size_t end : record_ends) {
        if (end < previous || end > encoded.size()) {
            throw std::invalid_argument("Record end " + std::to_string(end) +
                                        " out of order or past sequence length " +
                                        std::to_string(encoded.size()));
        }
        previous = end;
    }

    WindowKeyPacker window(length);
    size_t windows = 0;
    size_t next_record = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        while (next_record < record_ends.size() && record_ends[next_record] == i) {
            window.reset();
            ++next_record;
        }
        if (window.push(encoded[i])) {
            counter.increment(window.key());
            ++windows;
        }
    }
    return windows;
}

HashCounter count_all(const EncodedSequence& encoded, size_t length, size_t hash_bits) {
    HashCounter counter(hash_bits);
    count_into(encoded, length, counter);
    return counter;
}

uint64_t count_occurrences(const HashCounter& counter, const std::string& query, size_t length) {
    // Validate the query alphabet even when the length rules out a match.
    EncodedSequence codes = encode_sequence(query);
    if (codes.size() != length) {
        return 0;
    }
    return counter.get(pack_window(codes.data(), length));
}
