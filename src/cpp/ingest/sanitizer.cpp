#include "sanitizer.hpp"
#include <sstream>

namespace credingest {

namespace {

inline bool is_cont(unsigned char b) { return b >= 0x80 && b <= 0xBF; }

} // namespace

size_t Sanitizer::sequence_length(const unsigned char* d, size_t len) {
    if (len == 0) return 0;
    unsigned char b0 = d[0];

    if (b0 < 0x80) return 1;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        return (len >= 2 && is_cont(d[1])) ? 2 : 0;
    }

    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (len < 3) return 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (b0 == 0xE0) lo = 0xA0;          // overlong
        else if (b0 == 0xED) hi = 0x9F;     // UTF-16 surrogates
        if (d[1] < lo || d[1] > hi) return 0;
        return is_cont(d[2]) ? 3 : 0;
    }

    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (len < 4) return 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (b0 == 0xF0) lo = 0x90;          // overlong
        else if (b0 == 0xF4) hi = 0x8F;     // > U+10FFFF
        if (d[1] < lo || d[1] > hi) return 0;
        return (is_cont(d[2]) && is_cont(d[3])) ? 4 : 0;
    }

    // 0x80..0xC1 (stray continuation / overlong lead), 0xF5..0xFF
    return 0;
}

bool Sanitizer::is_valid_utf8(const std::string& input) {
    const auto* d = reinterpret_cast<const unsigned char*>(input.data());
    size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        size_t len = sequence_length(d + i, n - i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::string Sanitizer::sanitize(const std::string& input) {
    const auto* d = reinterpret_cast<const unsigned char*>(input.data());
    size_t n = input.size();

    // Fast path: the common case is already clean ASCII/UTF-8
    bool clean = true;
    for (size_t i = 0; i < n;) {
        size_t len = sequence_length(d + i, n - i);
        if (len == 0 || d[i] == 0) { clean = false; break; }
        i += len;
    }
    if (clean) return input;

    std::string out;
    out.reserve(n);
    size_t i = 0;
    while (i < n) {
        if (d[i] == 0) { ++i; continue; }
        size_t len = sequence_length(d + i, n - i);
        if (len == 0) {
            // Drop one byte and resynchronize on the next
            ++i;
            continue;
        }
        out.append(input, i, len);
        i += len;
    }
    return out;
}

std::vector<std::string> Sanitizer::split_lines(const std::string& raw) {
    std::istringstream in(raw);
    LineReader reader(in);
    std::vector<std::string> lines;
    std::string line;
    while (reader.next(line)) lines.push_back(line);
    return lines;
}

// --- LineReader ---

bool LineReader::fill() {
    if (eof_) return false;

    // Compact consumed prefix before growing
    if (pos_ > 0) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }

    size_t old = buf_.size();
    buf_.resize(old + chunk_size_);
    in_.read(&buf_[old], static_cast<std::streamsize>(chunk_size_));
    auto got = static_cast<size_t>(in_.gcount());
    buf_.resize(old + got);

    if (!in_) {
        if (in_.bad()) failed_ = true;
        eof_ = true;
    }
    return got > 0;
}

bool LineReader::next(std::string& line) {
    for (;;) {
        // Skip a leading NUL run
        while (pos_ < buf_.size() && buf_[pos_] == '\0') ++pos_;
        if (pos_ == buf_.size()) {
            if (!fill() && pos_ == buf_.size()) return false;
            continue;
        }

        size_t nl = buf_.find('\n', pos_);
        if (nl != std::string::npos) {
            line = buf_.substr(pos_, nl - pos_);
            pos_ = nl + 1;
            break;
        }

        if (eof_) {
            line = buf_.substr(pos_);
            pos_ = buf_.size();
            break;
        }
        fill();
    }

    line = Sanitizer::sanitize(line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    ++lines_read_;
    return true;
}

} // namespace credingest
