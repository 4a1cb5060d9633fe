#pragma once
// =============================================================================
// LineParser -- extracts (url, username, password) from one dump line
//
// ':' is overloaded: scheme separator "://", ports ":8080", and possibly the
// password itself. Matchers are tried in strict precedence order, most
// structured first; the first one that matches wins:
//
//   1. AppSchemeMatcher       scheme://<opaque>@<package>[/path]:user:pass
//   2. PortUrlMatcher         scheme://host[:port][/path]:user:pass
//   3. PathUrlMatcher         scheme://host[/path-with-query]:user:pass
//                             (host may contain ':' -- e.g. "[::1]")
//   4. ProtocolSplitMatcher   known scheme prefix, cut after "://" (and "@"
//                             for app schemes), next two ':' fields
//   5. ColonSplitMatcher      url:user:pass[:more] (url/user trimmed)
//   6. WhitespaceSplitMatcher url user pass [more]  (Unicode spaces, rejoined with ' ')
//
// In 1-4 the password absorbs any further colons. Every matcher is a single
// linear scan and total on arbitrary input; no match means "skip the line".
// =============================================================================

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../store/records.hpp"

namespace credingest {

enum class MatchKind {
    APP_SCHEME,
    URL_WITH_PORT,
    URL_WITH_PATH,
    PROTOCOL_SPLIT,
    COLON_SPLIT,
    WHITESPACE_SPLIT
};

inline const char* match_kind_str(MatchKind k) {
    switch (k) {
        case MatchKind::APP_SCHEME:       return "app_scheme";
        case MatchKind::URL_WITH_PORT:    return "url_with_port";
        case MatchKind::URL_WITH_PATH:    return "url_with_path";
        case MatchKind::PROTOCOL_SPLIT:   return "protocol_split";
        case MatchKind::COLON_SPLIT:      return "colon_split";
        case MatchKind::WHITESPACE_SPLIT: return "whitespace_split";
    }
    return "??";
}

class LineMatcher {
public:
    virtual ~LineMatcher() = default;
    virtual std::optional<ParsedTriple> try_match(const std::string& line) const = 0;
    [[nodiscard]] virtual MatchKind kind() const = 0;
};

class AppSchemeMatcher : public LineMatcher {
public:
    std::optional<ParsedTriple> try_match(const std::string& line) const override;
    [[nodiscard]] MatchKind kind() const override { return MatchKind::APP_SCHEME; }
};

class PortUrlMatcher : public LineMatcher {
public:
    std::optional<ParsedTriple> try_match(const std::string& line) const override;
    [[nodiscard]] MatchKind kind() const override { return MatchKind::URL_WITH_PORT; }
};

class PathUrlMatcher : public LineMatcher {
public:
    std::optional<ParsedTriple> try_match(const std::string& line) const override;
    [[nodiscard]] MatchKind kind() const override { return MatchKind::URL_WITH_PATH; }
};

class ProtocolSplitMatcher : public LineMatcher {
public:
    // Scheme tokens are matched as case-insensitive line prefixes
    ProtocolSplitMatcher(std::vector<std::string> known_schemes,
                         std::vector<std::string> app_schemes);

    std::optional<ParsedTriple> try_match(const std::string& line) const override;
    [[nodiscard]] MatchKind kind() const override { return MatchKind::PROTOCOL_SPLIT; }

private:
    std::vector<std::string> known_;
    std::vector<std::string> app_;
};

class ColonSplitMatcher : public LineMatcher {
public:
    std::optional<ParsedTriple> try_match(const std::string& line) const override;
    [[nodiscard]] MatchKind kind() const override { return MatchKind::COLON_SPLIT; }
};

class WhitespaceSplitMatcher : public LineMatcher {
public:
    std::optional<ParsedTriple> try_match(const std::string& line) const override;
    [[nodiscard]] MatchKind kind() const override { return MatchKind::WHITESPACE_SPLIT; }
};

struct ParseResult {
    ParsedTriple triple;
    MatchKind kind;
};

class LineParser {
public:
    // Default scheme tables: known {"http", "android"}, app {"android"}
    LineParser();
    LineParser(std::vector<std::string> known_schemes, std::vector<std::string> app_schemes);

    // nullopt for blank lines and lines no matcher accepts
    std::optional<ParseResult> parse(const std::string& line) const;

    [[nodiscard]] const std::vector<std::unique_ptr<LineMatcher>>& matchers() const {
        return matchers_;
    }

private:
    std::vector<std::unique_ptr<LineMatcher>> matchers_;
};

} // namespace credingest
