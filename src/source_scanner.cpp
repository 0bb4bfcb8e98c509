#include "source_scanner.h"
#include <regex>

namespace liverun {

namespace {

// Scan a literal starting at pos (pointing at the opening quote).
SourceSegment scan_string(const std::string& src, size_t pos) {
    const char quote = src[pos];
    const bool triple = pos + 2 < src.size() && src[pos + 1] == quote && src[pos + 2] == quote;

    SourceSegment seg{SegmentType::STRING, pos, src.size(), triple ? 3u : 1u, false};
    size_t i = pos + seg.quote_len;

    while (i < src.size()) {
        char c = src[i];
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (!triple && c == '\n') {
            seg.end = i;
            return seg;
        }
        if (c == quote) {
            if (!triple) {
                seg.end = i + 1;
                seg.terminated = true;
                return seg;
            }
            if (i + 2 < src.size() && src[i + 1] == quote && src[i + 2] == quote) {
                seg.end = i + 3;
                seg.terminated = true;
                return seg;
            }
        }
        ++i;
    }

    seg.end = src.size();
    return seg;
}

} // namespace

std::vector<SourceSegment> SourceScanner::scan(const std::string& source) {
    std::vector<SourceSegment> segments;
    size_t code_start = 0;
    size_t i = 0;

    auto flush_code = [&](size_t upto) {
        if (upto > code_start) {
            segments.push_back({SegmentType::CODE, code_start, upto});
        }
    };

    while (i < source.size()) {
        char c = source[i];
        if (c == '#') {
            flush_code(i);
            size_t end = source.find('\n', i);
            if (end == std::string::npos) end = source.size();
            segments.push_back({SegmentType::COMMENT, i, end});
            i = end;
            code_start = i;
        } else if (c == '"' || c == '\'') {
            flush_code(i);
            SourceSegment seg = scan_string(source, i);
            segments.push_back(seg);
            i = seg.end;
            code_start = i;
        } else {
            ++i;
        }
    }
    flush_code(source.size());

    return segments;
}

std::string SourceScanner::strip_strings_and_comments(const std::string& source) {
    std::string residual;
    residual.reserve(source.size());

    for (const auto& seg : scan(source)) {
        if (seg.type == SegmentType::CODE) {
            residual.append(source, seg.begin, seg.end - seg.begin);
        }
    }
    return residual;
}

std::string SourceScanner::normalize_path_literals(const std::string& source) {
    static const std::regex extension_pattern(R"(\.\w{1,5}(?:$|\W))");

    std::string result;
    result.reserve(source.size());

    for (const auto& seg : scan(source)) {
        std::string text = source.substr(seg.begin, seg.end - seg.begin);

        if (seg.type == SegmentType::STRING && seg.terminated &&
            text.find('\\') != std::string::npos) {
            size_t inner_len = text.size() - 2 * seg.quote_len;
            std::string inner = text.substr(seg.quote_len, inner_len);

            if (std::regex_search(inner, extension_pattern)) {
                std::string rewritten;
                rewritten.reserve(inner.size());
                for (size_t i = 0; i < inner.size(); ++i) {
                    if (inner[i] == '\\' && i + 1 < inner.size() && inner[i + 1] == '\\') {
                        rewritten += '/';
                        ++i;
                    } else {
                        rewritten += inner[i];
                    }
                }
                std::string quotes = text.substr(0, seg.quote_len);
                text = quotes + rewritten + quotes;
            }
        }

        result += text;
    }

    return result;
}

} // namespace liverun
