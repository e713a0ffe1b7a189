/**
 * @file sequence_reader.hpp
 * @brief Loads a whole FASTA / FASTQ / raw sequence into memory
 *
 * Framing is removed here: FASTA headers, FASTQ header/separator/quality
 * lines and all line terminators. What is left is handed to the encoder
 * untouched, so stray bytes inside sequence lines still fail encoding.
 */

#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include <zlib.h>

enum class FileFormat { FASTA, FASTQ, RAW };
enum class CompressionType { NONE, GZIP };

// ============================================================================
// BUFFERED READER (Supports plain and gzip files)
// ============================================================================

class BufferedReader {
private:
    static constexpr size_t BUFFER_SIZE = 16 * 1024 * 1024;  // 16MB
    std::vector<char> buffer_;
    size_t pos_ = 0;
    size_t valid_ = 0;
    gzFile gz_file_ = nullptr;
    FILE* plain_file_ = nullptr;
    CompressionType compression_;
    std::string name_;
    bool eof_ = false;

    // Load the next block; false once the source is exhausted
    bool refill();
    void close_all();

public:
    /**
     * @brief Open a path, or standard input when filename is "-"
     *
     * Standard input always goes through zlib, which passes plain data
     * through unchanged, so piped gzip streams work too.
     */
    BufferedReader(const std::string& filename, CompressionType comp);
    ~BufferedReader() { close_all(); }

    BufferedReader(const BufferedReader&) = delete;
    BufferedReader& operator=(const BufferedReader&) = delete;

    int peek() {
        if (pos_ == valid_ && !refill()) return EOF;
        return static_cast<unsigned char>(buffer_[pos_]);
    }

    int get() {
        if (pos_ == valid_ && !refill()) return EOF;
        return static_cast<unsigned char>(buffer_[pos_++]);
    }
};

CompressionType detect_compression(const std::string& filename);

// ============================================================================
// SEQUENCE READER
// ============================================================================

/**
 * @brief Concatenated bases of every record plus where each record ends
 *
 * Record i spans [record_ends[i-1], record_ends[i]) of bases (the first
 * starts at 0). Windows must not cross a record end: FASTA records and
 * FASTQ reads are independent sequences.
 */
struct SequenceData {
    std::string bases;
    std::vector<size_t> record_ends;
};

class SequenceReader {
private:
    std::string filename_;
    CompressionType compression_;

    void read_fasta(BufferedReader& reader, SequenceData& out) const;
    void read_fastq(BufferedReader& reader, SequenceData& out) const;
    void read_raw(BufferedReader& reader, SequenceData& out) const;

public:
    explicit SequenceReader(const std::string& filename);

    CompressionType compression() const { return compression_; }

    /**
     * @brief Read every record into memory, in file order
     *
     * FASTA: one record per '>' header (lines of a record are joined).
     * FASTQ: one record per read. Raw: the whole stream is one record.
     *
     * @param format set to the detected format when non-null
     * @throws std::runtime_error on open/read failure
     */
    SequenceData read_all(FileFormat* format = nullptr) const;
};

const char* format_name(FileFormat format);
