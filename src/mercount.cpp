/**
 * @file mercount.cpp
 * @brief mercount - exact fixed-length window counter for nucleotide streams
 * @version 1.0
 *
 * Counts every window of length L (L = query length, at most 32) in a
 * FASTA, FASTQ or raw sequence (plain or gzip-compressed, or stdin), then
 * reports the count of each query window.
 *
 * Windows are packed 2 bits per base into a 64-bit key with a rolling
 * shift-or, and counted in a fixed-size chained hash table.
 *
 * Compile: see CMakeLists.txt (C++17, zlib)
 */

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "exit_status.hpp"
#include "hash_counter.hpp"
#include "sequence_reader.hpp"
#include "sequence_scanner.hpp"
#include "symbol_encoding.hpp"
#include "window_key.hpp"

namespace {

constexpr const char* DEFAULT_QUERY = "GGTATTTTAATTTATAGT";

struct Options {
    std::string input_file;
    std::vector<std::string> queries;
    size_t hash_bits = HashCounter::DEFAULT_HASH_BITS;
    std::string dump_file;
};

void print_usage(const char* program) {
    std::cerr << "mercount 1.0 - fixed-length window counter\n\n";
    std::cerr << "Usage: " << program << " [-b hash_bits] [-o counts.txt] <input|-> [query ...]\n\n";
    std::cerr << "  -b N   hash table of 2^N buckets (1-" << HashCounter::MAX_HASH_BITS
              << ", default " << HashCounter::DEFAULT_HASH_BITS << ")\n";
    std::cerr << "  -o F   also write every distinct window and its count to F\n";
    std::cerr << "  -h     show this help\n\n";
    std::cerr << "Window length is the query length; all queries must be the same length.\n";
    std::cerr << "Default query: " << DEFAULT_QUERY << "\n\n";
    std::cerr << "Supported input (auto-detected): FASTA, FASTQ, raw lines; .gz is decompressed.\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program << " genome.fa GGTATTTTAATTTATAGT\n";
    std::cerr << "  zcat reads.fq.gz | " << program << " -b 22 - ACGTACGTAC TTTTTTTTTT\n";
}

size_t parse_hash_bits(const std::string& text) {
    char* end = nullptr;
    long bits = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || bits < 1 || bits > static_cast<long>(HashCounter::MAX_HASH_BITS)) {
        throw std::invalid_argument("hash bits must be between 1 and " +
                                    std::to_string(HashCounter::MAX_HASH_BITS) + ", got '" + text + "'");
    }
    return static_cast<size_t>(bits);
}

/**
 * @return false if help was requested
 * @throws std::invalid_argument on malformed command lines
 */
bool parse_options(int argc, char* argv[], Options& opts) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return false;
        } else if (arg == "-b" || arg == "-o") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + arg + " needs a value");
            }
            std::string value = argv[++i];
            if (arg == "-b") {
                opts.hash_bits = parse_hash_bits(value);
            } else {
                opts.dump_file = value;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw std::invalid_argument("missing input file");
    }
    opts.input_file = positional[0];
    opts.queries.assign(positional.begin() + 1, positional.end());
    if (opts.queries.empty()) {
        opts.queries.push_back(DEFAULT_QUERY);
    }

    // Fail fast on configuration errors, before the input is read
    size_t length = opts.queries[0].size();
    WindowKeyPacker check(length);
    for (const auto& q : opts.queries) {
        if (q.size() != length) {
            throw std::invalid_argument("query '" + q + "' has length " + std::to_string(q.size()) +
                                        ", expected " + std::to_string(length));
        }
        encode_sequence(q);
    }
    return true;
}

void write_counts(const HashCounter& counter, size_t length, const std::string& output_file) {
    std::ofstream output(output_file);
    if (!output) {
        throw std::runtime_error("Cannot open output file: " + output_file);
    }
    for (const auto& entry : counter) {
        output << unpack_window(entry.key, length) << '\t' << entry.count << '\n';
    }
    output.flush();
    if (!output) {
        throw std::runtime_error("Error writing output file: " + output_file);
    }
    std::cerr << "Wrote " << counter.size() << " output lines\n";
}

// ============================================================================
// COUNTING PASS
// ============================================================================

int run_counting(const Options& opts) {
    size_t length = opts.queries[0].size();

    SequenceReader reader(opts.input_file);
    FileFormat format = FileFormat::RAW;

    SequenceData data = reader.read_all(&format);
    EncodedSequence encoded = encode_sequence(data.bases);
    std::string().swap(data.bases);

    const char* comp_str = (reader.compression() == CompressionType::GZIP) ? " (gzip)" : "";
    std::cerr << "Format: " << format_name(format) << comp_str << "\n";
    std::cerr << "Records: " << data.record_ends.size() << "\n";
    std::cerr << "Sequence length: " << encoded.size() << "\n";

    HashCounter counter(opts.hash_bits);
    std::cerr << "Counting " << length << "-mers into " << counter.bucket_count() << " buckets...\n";

    size_t windows = count_records(encoded, data.record_ends, length, counter);

    std::cerr << "Counted " << windows << " windows\n";
    std::cerr << "Found " << counter.size() << " distinct keys\n";
    std::cerr << "Hash table load factor: " << (counter.load_factor() * 100) << "%\n";
    std::cerr << "Longest chain: " << counter.max_chain_length() << "\n";

    for (const auto& q : opts.queries) {
        std::cout << count_occurrences(counter, q, length) << '\t' << q << '\n';
    }

    if (!opts.dump_file.empty()) {
        std::cerr << "Writing output...\n";
        write_counts(counter, length, opts.dump_file);
    }

    std::cerr << "Done.\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    try {
        if (!parse_options(argc, argv, opts)) {
            print_usage(argv[0]);
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: invalid query: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    std::cerr << "mercount 1.0 - window counter\n";
    std::cerr << "=============================\n";
    std::cerr << "Input:  " << opts.input_file << "\n";
    std::cerr << "L:      " << opts.queries[0].size() << "\n";
    std::cerr << "Hash:   2^" << opts.hash_bits << " buckets\n";

    try {
        return run_counting(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_status_for(e);
    }
}
