#include "line_parser.hpp"
#include <algorithm>
#include <cctype>

namespace credingest {

namespace {

constexpr size_t npos = std::string::npos;

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// Byte length of the whitespace character at s[i], 0 if none. Besides ASCII
// this covers the Unicode White_Space code points that survive sanitizing:
// U+0085, U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029, U+202F, U+205F,
// U+3000. Lead bytes never match a continuation byte, so callers may step
// through non-space text one byte at a time.
size_t space_len(const std::string& s, size_t i) {
    auto b = [&s](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = b(i);
    if (c < 0x80) return is_space(static_cast<char>(c)) ? 1 : 0;

    size_t left = s.size() - i;
    if (c == 0xC2 && left >= 2) {
        return (b(i + 1) == 0x85 || b(i + 1) == 0xA0) ? 2 : 0;
    }
    if (left < 3) return 0;
    unsigned char c1 = b(i + 1), c2 = b(i + 2);
    switch (c) {
        case 0xE1: return (c1 == 0x9A && c2 == 0x80) ? 3 : 0;
        case 0xE2:
            if (c1 == 0x80 && ((c2 >= 0x80 && c2 <= 0x8A) ||
                               c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF)) return 3;
            return (c1 == 0x81 && c2 == 0x9F) ? 3 : 0;
        case 0xE3: return (c1 == 0x80 && c2 == 0x80) ? 3 : 0;
        default:   return 0;
    }
}

std::string trim(const std::string& s) {
    size_t start = npos, end = 0;
    for (size_t i = 0; i < s.size();) {
        size_t n = space_len(s, i);
        if (n > 0) {
            i += n;
            continue;
        }
        if (start == npos) start = i;
        end = ++i;
    }
    if (start == npos) return std::string();
    return s.substr(start, end - start);
}

bool all_space(const std::string& s) {
    for (size_t i = 0; i < s.size();) {
        size_t n = space_len(s, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Index just past "scheme://" for a leading [A-Za-z][A-Za-z0-9+.-]*://, else npos
size_t scheme_end(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return npos;
    size_t i = 1;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isalnum(c) || c == '+' || c == '.' || c == '-') { ++i; continue; }
        break;
    }
    if (s.compare(i, 3, "://") != 0) return npos;
    return i + 3;
}

// s[colon] == ':' ends the URL; then a non-empty colon-free username, ':',
// and a non-empty password that keeps any further colons
bool split_tail(const std::string& s, size_t colon, ParsedTriple& out) {
    if (colon >= s.size() || s[colon] != ':') return false;
    size_t user_start = colon + 1;
    size_t user_end = s.find(':', user_start);
    if (user_end == npos || user_end == user_start) return false;
    if (user_end + 1 >= s.size()) return false;

    out.url = s.substr(0, colon);
    out.username = s.substr(user_start, user_end - user_start);
    out.password = s.substr(user_end + 1);
    return true;
}

// Optional "/[^:]*" starting at pos; returns where the URL must end
size_t skip_path(const std::string& s, size_t pos) {
    if (pos < s.size() && s[pos] == '/') return s.find(':', pos);
    return pos;
}

} // namespace

// --- 1. scheme://<opaque>@<package>[/path]:user:pass ---

std::optional<ParsedTriple> AppSchemeMatcher::try_match(const std::string& line) const {
    size_t p = scheme_end(line);
    if (p == npos) return std::nullopt;

    // '@' must come before the first '/' after the scheme
    size_t at = line.find_first_of("@/", p);
    if (at == npos || line[at] != '@' || at == p) return std::nullopt;

    size_t pkg = at + 1;
    if (pkg >= line.size() || line[pkg] == '/' || line[pkg] == ':') return std::nullopt;

    // Package runs to '/' or ':'; a path runs to ':' -- either way the URL
    // ends at the first colon after the '@'
    size_t colon = line.find(':', pkg);
    if (colon == npos) return std::nullopt;

    ParsedTriple t;
    if (!split_tail(line, colon, t)) return std::nullopt;
    return t;
}

// --- 2. scheme://host[:port][/path]:user:pass ---

std::optional<ParsedTriple> PortUrlMatcher::try_match(const std::string& line) const {
    size_t p = scheme_end(line);
    if (p == npos) return std::nullopt;

    size_t host_end = line.find_first_of("/:", p);
    if (host_end == npos || host_end == p) return std::nullopt;

    ParsedTriple t;

    // With a numeric port (all digits, greedy)
    if (line[host_end] == ':') {
        size_t d = host_end + 1;
        while (d < line.size() && std::isdigit(static_cast<unsigned char>(line[d]))) ++d;
        if (d > host_end + 1) {
            size_t url_end = skip_path(line, d);
            if (url_end != npos && split_tail(line, url_end, t)) return t;
        }
    }

    // Without a port: the colon after the host starts the username
    size_t url_end = skip_path(line, host_end);
    if (url_end != npos && split_tail(line, url_end, t)) return t;

    return std::nullopt;
}

// --- 3. scheme://host[/path]:user:pass with a colon-permissive host ---

std::optional<ParsedTriple> PathUrlMatcher::try_match(const std::string& line) const {
    size_t p = scheme_end(line);
    if (p == npos) return std::nullopt;

    size_t region_end = line.find('/', p);
    if (region_end == npos) region_end = line.size();
    if (region_end == p) return std::nullopt;

    ParsedTriple t;

    // Longest host first: everything up to the first '/', then the path
    if (region_end < line.size()) {
        size_t url_end = line.find(':', region_end);
        if (url_end != npos && split_tail(line, url_end, t)) return t;
    }

    // Shorter hosts: end at a colon inside the host region, rightmost first
    for (size_t k = region_end - 1; k > p; --k) {
        if (line[k] == ':' && split_tail(line, k, t)) return t;
    }

    return std::nullopt;
}

// --- 4. known scheme prefix, split after "://" (and "@" for app schemes) ---

ProtocolSplitMatcher::ProtocolSplitMatcher(std::vector<std::string> known_schemes,
                                           std::vector<std::string> app_schemes)
    : known_(std::move(known_schemes)), app_(std::move(app_schemes)) {}

std::optional<ParsedTriple> ProtocolSplitMatcher::try_match(const std::string& line) const {
    auto has_prefix = [&line](const std::string& s) { return starts_with_ci(line, s); };
    bool is_app = std::any_of(app_.begin(), app_.end(), has_prefix);
    if (!is_app && !std::any_of(known_.begin(), known_.end(), has_prefix)) return std::nullopt;

    size_t proto = line.find("://");
    if (proto == npos || proto == 0) return std::nullopt;

    size_t url_prefix = proto + 3;
    if (is_app) {
        size_t at = line.find('@', url_prefix);
        if (at != npos && at > url_prefix) url_prefix = at + 1;
    }

    size_t c1 = line.find(':', url_prefix);
    if (c1 == npos) return std::nullopt;
    size_t c2 = line.find(':', c1 + 1);
    if (c2 == npos) return std::nullopt;

    ParsedTriple t;
    t.url = line.substr(0, c1);
    t.username = line.substr(c1 + 1, c2 - c1 - 1);
    t.password = line.substr(c2 + 1);
    return t;
}

// --- 5. url:user:pass[:more] ---

std::optional<ParsedTriple> ColonSplitMatcher::try_match(const std::string& line) const {
    size_t c1 = line.find(':');
    if (c1 == npos) return std::nullopt;
    size_t c2 = line.find(':', c1 + 1);
    if (c2 == npos) return std::nullopt;

    ParsedTriple t;
    t.url = trim(line.substr(0, c1));
    t.username = trim(line.substr(c1 + 1, c2 - c1 - 1));
    t.password = line.substr(c2 + 1);
    return t;
}

// --- 6. url user pass [more] ---

std::optional<ParsedTriple> WhitespaceSplitMatcher::try_match(const std::string& line) const {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < line.size()) {
        size_t n;
        while (i < line.size() && (n = space_len(line, i)) > 0) i += n;
        if (i >= line.size()) break;
        size_t start = i;
        while (i < line.size() && space_len(line, i) == 0) ++i;
        fields.push_back(line.substr(start, i - start));
    }
    if (fields.size() < 3) return std::nullopt;

    ParsedTriple t;
    t.url = fields[0];
    t.username = fields[1];
    for (size_t f = 2; f < fields.size(); ++f) {
        if (f > 2) t.password += ' ';
        t.password += fields[f];
    }
    return t;
}

// --- LineParser ---

LineParser::LineParser() : LineParser({"http", "android"}, {"android"}) {}

LineParser::LineParser(std::vector<std::string> known_schemes,
                       std::vector<std::string> app_schemes) {
    matchers_.push_back(std::make_unique<AppSchemeMatcher>());
    matchers_.push_back(std::make_unique<PortUrlMatcher>());
    matchers_.push_back(std::make_unique<PathUrlMatcher>());
    matchers_.push_back(std::make_unique<ProtocolSplitMatcher>(
        std::move(known_schemes), std::move(app_schemes)));
    matchers_.push_back(std::make_unique<ColonSplitMatcher>());
    matchers_.push_back(std::make_unique<WhitespaceSplitMatcher>());
}

std::optional<ParseResult> LineParser::parse(const std::string& line) const {
    if (all_space(line)) return std::nullopt;

    for (const auto& m : matchers_) {
        if (auto t = m->try_match(line)) {
            return ParseResult{std::move(*t), m->kind()};
        }
    }
    return std::nullopt;
}

} // namespace credingest
