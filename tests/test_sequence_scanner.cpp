// tests/test_sequence_scanner.cpp
// Window counts against a brute-force substring scan, plus edge cases.

#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include "../src/sequence_scanner.hpp"
#include "../src/window_key.hpp"

static std::string random_dna(size_t n, uint64_t seed) {
    static const char bases[] = "ACGT";
    std::mt19937_64 rng(seed);
    std::string s(n, 'A');
    for (auto &c : s) c = bases[rng() & 3];
    return s;
}

static uint64_t brute_force(const std::string &text, const std::string &w) {
    uint64_t n = 0;
    for (size_t pos = text.find(w); pos != std::string::npos; pos = text.find(w, pos + 1)) ++n;
    return n;
}

int main() {
    // "AAAA", L=2: three AA windows
    HashCounter aaaa = count_all(encode_sequence("AAAA"), 2);
    if (aaaa.get(key_of("AA")) != 3) {
        std::cerr << "AAAA: expected 3 AA windows, got " << aaaa.get(key_of("AA")) << "\n";
        return 2;
    }
    if (aaaa.get(key_of("GG")) != 0 || aaaa.size() != 1) {
        std::cerr << "AAAA: only AA should be present\n";
        return 3;
    }

    // shorter than L: zero windows, every query 0
    HashCounter shortc(10);
    size_t windows = count_into(encode_sequence("ACG"), 5, shortc);
    if (windows != 0 || !shortc.empty() || count_occurrences(shortc, "ACGTA", 5) != 0) {
        std::cerr << "input shorter than L should yield an empty table\n";
        return 4;
    }

    // every window of a small string matches its brute-force count
    const std::string text = random_dna(3000, 11) + "ACGTACGTACGT" + random_dna(500, 12);
    const size_t lengths[] = {1, 3, 6, 12};
    for (size_t L : lengths) {
        EncodedSequence enc = encode_sequence(text);
        HashCounter hc = count_all(enc, L, 8);
        if (count_into(enc, L, hc) != text.size() - L + 1) {
            std::cerr << "window count wrong for L=" << L << "\n";
            return 5;
        }
        for (size_t i = 0; i + L <= text.size(); ++i) {
            std::string w = text.substr(i, L);
            // table was filled twice above
            if (hc.get(key_of(w)) != 2 * brute_force(text, w)) {
                std::cerr << "L=" << L << " window " << w << " count " << hc.get(key_of(w))
                          << " expected " << 2 * brute_force(text, w) << "\n";
                return 6;
            }
        }
    }

    // same input twice -> same counts
    EncodedSequence enc = encode_sequence(text);
    HashCounter a = count_all(enc, 7, 10);
    HashCounter b = count_all(enc, 7, 10);
    if (a.size() != b.size()) {
        std::cerr << "repeat run produced a different number of keys\n";
        return 7;
    }
    for (const auto &e : a) {
        if (b.get(e.key) != e.count) {
            std::cerr << "repeat run disagrees on " << unpack_window(e.key, 7) << "\n";
            return 8;
        }
    }

    // query of another length can never match
    if (count_occurrences(a, "ACGT", 7) != 0) {
        std::cerr << "length-mismatched query should count 0\n";
        return 9;
    }

    // windows never span two records: reads AAAACG and TTTTTT
    HashCounter reads(6);
    EncodedSequence joined = encode_sequence("AAAACGTTTTTT");
    size_t read_windows = count_records(joined, {6, 12}, 4, reads);
    if (read_windows != 6) {
        std::cerr << "two reads of 6 at L=4 give 6 windows, got " << read_windows << "\n";
        return 12;
    }
    if (reads.get(key_of("CGTT")) != 0 || reads.get(key_of("ACGT")) != 0 ||
        reads.get(key_of("GTTT")) != 0) {
        std::cerr << "window across the read boundary was counted\n";
        return 13;
    }
    if (reads.get(key_of("AAAA")) != 1 || reads.get(key_of("AACG")) != 1 ||
        reads.get(key_of("TTTT")) != 3) {
        std::cerr << "windows inside the reads counted wrong\n";
        return 14;
    }

    // no record ends: one record, same as count_into; trailing bases after
    // the last end form a final record; empty records are harmless
    HashCounter whole(6), split(6);
    count_into(joined, 4, whole);
    count_records(joined, {}, 4, split);
    if (whole.size() != split.size() || split.get(key_of("CGTT")) != 1) {
        std::cerr << "empty record list should count like count_into\n";
        return 15;
    }
    HashCounter tail(6);
    if (count_records(joined, {0, 0, 6}, 4, tail) != 6 || tail.get(key_of("ACGT")) != 0) {
        std::cerr << "bases after the last record end should be their own record\n";
        return 16;
    }

    bool threw = false;
    try {
        HashCounter bad(4);
        count_records(joined, {8, 4}, 4, bad);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "descending record ends should throw\n";
        return 17;
    }

    // multi-megabyte stream at L=18, checked against a brute-force scan
    const std::string query = "GGTATTTTAATTTATAGT";
    std::string big = random_dna(2 * 1024 * 1024, 2024);
    // plant a few known occurrences, one overlapping the very end
    big.replace(1000, query.size(), query);
    big.replace(2000000, query.size(), query);
    big.replace(big.size() - query.size(), query.size(), query);
    HashCounter hc18 = count_all(encode_sequence(big), query.size(), 20);
    uint64_t expected = brute_force(big, query);
    if (expected < 3 || count_occurrences(hc18, query, query.size()) != expected) {
        std::cerr << "L=18: count " << count_occurrences(hc18, query, query.size())
                  << " expected " << expected << "\n";
        return 10;
    }
    const std::string probe = big.substr(123456, 18);
    if (count_occurrences(hc18, probe, 18) != brute_force(big, probe)) {
        std::cerr << "L=18: probe window count mismatch\n";
        return 11;
    }

    std::cout << "test_sequence_scanner: OK\n";
    return 0;
}
