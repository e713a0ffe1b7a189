#include "sequence_reader.hpp"

#include <stdexcept>

#include <sys/stat.h>
#include <unistd.h>

namespace {

bool is_stdin(const std::string& filename) {
    return filename == "-";
}

inline bool is_line_end(int c) {
    return c == '\n' || c == '\r';
}

size_t file_size_hint(const std::string& filename) {
    struct stat file_stat;
    if (is_stdin(filename) || stat(filename.c_str(), &file_stat) != 0) {
        return 0;
    }
    return static_cast<size_t>(file_stat.st_size);
}

void skip_line(BufferedReader& reader) {
    int c;
    do {
        c = reader.get();
    } while (c != '\n' && c != EOF);
}

// Append the rest of the current line, minus its terminator.
void append_line(BufferedReader& reader, std::string& out) {
    int c;
    while ((c = reader.get()) != '\n' && c != EOF) {
        if (c != '\r') {
            out.push_back(static_cast<char>(c));
        }
    }
}

}  // namespace

// ============================================================================
// BUFFERED READER
// ============================================================================

BufferedReader::BufferedReader(const std::string& filename, CompressionType comp)
    : buffer_(BUFFER_SIZE), compression_(comp), name_(filename) {

    if (is_stdin(filename)) {
        int fd = dup(fileno(stdin));
        if (fd < 0) {
            throw std::runtime_error("Cannot duplicate standard input");
        }
        gz_file_ = gzdopen(fd, "rb");
        if (!gz_file_) {
            close(fd);
            throw std::runtime_error("Cannot open standard input");
        }
        compression_ = CompressionType::GZIP;
        name_ = "<stdin>";
    } else if (compression_ == CompressionType::GZIP) {
        gz_file_ = gzopen(filename.c_str(), "rb");
        if (!gz_file_) {
            throw std::runtime_error("Cannot open gzip file: " + filename);
        }
    } else {
        plain_file_ = fopen(filename.c_str(), "rb");
        if (!plain_file_) {
            throw std::runtime_error("Cannot open file: " + filename);
        }
    }

    if (gz_file_) {
        gzbuffer(gz_file_, BUFFER_SIZE);
    }

    try {
        refill();
    } catch (...) {
        close_all();
        throw;
    }
}

void BufferedReader::close_all() {
    if (gz_file_) gzclose(gz_file_);
    if (plain_file_) fclose(plain_file_);
    gz_file_ = nullptr;
    plain_file_ = nullptr;
}

bool BufferedReader::refill() {
    if (eof_) return false;

    if (compression_ == CompressionType::GZIP) {
        int bytes_read = gzread(gz_file_, buffer_.data(), BUFFER_SIZE);
        if (bytes_read < 0) {
            int errnum = 0;
            const char* msg = gzerror(gz_file_, &errnum);
            throw std::runtime_error("Error reading gzip stream " + name_ + ": " + msg);
        }
        valid_ = static_cast<size_t>(bytes_read);
        if (bytes_read == 0) {
            eof_ = true;
        }
    } else {
        size_t bytes_read = fread(buffer_.data(), 1, BUFFER_SIZE, plain_file_);
        if (bytes_read == 0 && ferror(plain_file_)) {
            throw std::runtime_error("Error reading file: " + name_);
        }
        valid_ = bytes_read;
        if (bytes_read == 0) {
            eof_ = true;
        }
    }
    pos_ = 0;
    return valid_ > 0;
}

CompressionType detect_compression(const std::string& filename) {
    if (filename.size() >= 3 && filename.substr(filename.size() - 3) == ".gz") {
        return CompressionType::GZIP;
    }
    return CompressionType::NONE;
}

const char* format_name(FileFormat format) {
    switch (format) {
        case FileFormat::FASTA: return "FASTA";
        case FileFormat::FASTQ: return "FASTQ";
        case FileFormat::RAW:   return "raw";
    }
    return "unknown";
}

// ============================================================================
// SEQUENCE READER
// ============================================================================

SequenceReader::SequenceReader(const std::string& filename)
    : filename_(filename), compression_(detect_compression(filename)) {
}

SequenceData SequenceReader::read_all(FileFormat* format) const {
    BufferedReader reader(filename_, compression_);

    // Leading blank lines do not decide the format
    while (is_line_end(reader.peek())) {
        reader.get();
    }

    FileFormat detected = FileFormat::RAW;
    int first = reader.peek();
    if (first == '>') {
        detected = FileFormat::FASTA;
    } else if (first == '@') {
        detected = FileFormat::FASTQ;
    }
    if (format) {
        *format = detected;
    }

    SequenceData data;
    data.bases.reserve(file_size_hint(filename_));

    switch (detected) {
        case FileFormat::FASTA: read_fasta(reader, data); break;
        case FileFormat::FASTQ: read_fastq(reader, data); break;
        case FileFormat::RAW:   read_raw(reader, data);   break;
    }
    data.bases.shrink_to_fit();
    return data;
}

void SequenceReader::read_fasta(BufferedReader& reader, SequenceData& out) const {
    bool in_record = false;
    int c;
    while ((c = reader.peek()) != EOF) {
        if (c == '>') {
            if (in_record) {
                out.record_ends.push_back(out.bases.size());
            }
            in_record = true;
            skip_line(reader);
        } else {
            append_line(reader, out.bases);
        }
    }
    if (in_record) {
        out.record_ends.push_back(out.bases.size());
    }
}

void SequenceReader::read_fastq(BufferedReader& reader, SequenceData& out) const {
    // 4 lines per read: @header, bases, +separator, qualities
    int c;
    while ((c = reader.peek()) != EOF) {
        if (c != '@') {
            skip_line(reader);
            continue;
        }
        skip_line(reader);
        append_line(reader, out.bases);
        out.record_ends.push_back(out.bases.size());
        skip_line(reader);
        skip_line(reader);
    }
}

void SequenceReader::read_raw(BufferedReader& reader, SequenceData& out) const {
    int c;
    while ((c = reader.get()) != EOF) {
        if (!is_line_end(c)) {
            out.bases.push_back(static_cast<char>(c));
        }
    }
    out.record_ends.push_back(out.bases.size());
}
