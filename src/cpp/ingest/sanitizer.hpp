#pragma once
// =============================================================================
// Sanitizer -- repairs captured dump bytes into storable text
//
// Dump files are adversarial: truncated multi-byte sequences, NUL padding
// from concurrent writers, arbitrary binary junk. Nothing here ever fails:
//   - sanitize() strips NUL bytes and drops every byte that does not start a
//     well-formed UTF-8 sequence (overlongs, surrogates and > U+10FFFF count
//     as malformed). The result is valid UTF-8 and sanitize() is idempotent.
//   - LineReader splits a byte stream on '\n', skipping NUL runs at the start
//     of each line, and returns every line already sanitized.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace credingest {

class Sanitizer {
public:
    static std::string sanitize(const std::string& input);

    [[nodiscard]] static bool is_valid_utf8(const std::string& input);

    // Length of the well-formed UTF-8 sequence starting at data[0], or 0
    static size_t sequence_length(const unsigned char* data, size_t len);

    // Whole-buffer variant of LineReader (used for small inputs and tests)
    static std::vector<std::string> split_lines(const std::string& raw);
};

class LineReader {
public:
    explicit LineReader(std::istream& in, size_t chunk_size = 512 * 1024)
        : in_(in), chunk_size_(chunk_size == 0 ? 4096 : chunk_size) {}

    // Next sanitized line without its terminator (a trailing '\r' is removed).
    // Returns false at end of input.
    bool next(std::string& line);

    [[nodiscard]] uint64_t lines_read() const { return lines_read_; }
    // True if the underlying stream reported a read error (not EOF)
    [[nodiscard]] bool failed() const { return failed_; }

private:
    bool fill();

    std::istream& in_;
    size_t chunk_size_;
    std::string buf_;
    size_t pos_ = 0;
    bool eof_ = false;
    bool failed_ = false;
    uint64_t lines_read_ = 0;
};

} // namespace credingest
