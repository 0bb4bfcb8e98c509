#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace liverun {

enum class SegmentType {
    CODE,
    STRING,     // Quoted literal, quotes included
    COMMENT     // From '#' up to (not including) the newline
};

struct SourceSegment {
    SegmentType type;
    size_t begin;               // Offset into the source
    size_t end;                 // One past the last byte
    size_t quote_len = 0;       // 1 or 3 for strings
    bool terminated = true;     // False for a string running to end of line/file
};

// Lexical scanner for Python-like source. Understands '#' comments, single
// and triple quoted literals and backslash escapes; does not parse anything
// else. Line-continued single-quoted strings and f-string replacement fields
// are treated as plain string text.
class SourceScanner {
public:
    static std::vector<SourceSegment> scan(const std::string& source);

    // Source with every string literal and comment removed
    static std::string strip_strings_and_comments(const std::string& source);

    // Rewrites string literals that look like Windows file paths: each
    // doubled backslash becomes '/'. A literal qualifies when it contains a
    // backslash and a dotted extension of 1-5 word characters.
    static std::string normalize_path_literals(const std::string& source);
};

} // namespace liverun
