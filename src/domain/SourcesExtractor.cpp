/**
 * @file SourcesExtractor.cpp
 * @brief Implementation of SourcesExtractor.
 */

#include "domain/SourcesExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sourcemark::domain {

namespace {

// Citation grammar, matched case-insensitively:
//   (start-of-text | [\s.(]+) "source" ["s"] \s* ":" \s* capture
// where the capture runs up to (excluding) the next '.' or '\n'.
// Scanned by hand: every step is a loop, so long whitespace runs or long
// citations cost no stack.

struct CitationMatch {
    size_t start = 0;
    size_t end = 0;
    size_t captureStart = 0;
};

const char kKeyword[] = "source";
const size_t kKeywordLength = sizeof(kKeyword) - 1;

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool IsDelimiter(char c) {
    return IsSpace(c) || c == '.' || c == '(';
}

bool KeywordAt(const std::string& text, size_t pos) {
    if (text.size() - pos < kKeywordLength) return false;
    for (size_t i = 0; i < kKeywordLength; ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != kKeyword[i]) return false;
    }
    return true;
}

size_t SkipSpaces(const std::string& text, size_t pos) {
    while (pos < text.size() && IsSpace(text[pos])) ++pos;
    return pos;
}

// Returns the capture start for a keyword at pos, or npos if no colon follows.
size_t MatchTail(const std::string& text, size_t pos) {
    pos += kKeywordLength;
    if (pos < text.size() && std::tolower(static_cast<unsigned char>(text[pos])) == 's') ++pos;
    pos = SkipSpaces(text, pos);
    if (pos >= text.size() || text[pos] != ':') return std::string::npos;
    return SkipSpaces(text, pos + 1);
}

// Leftmost citation starting at or after `from`.
bool FindCitation(const std::string& text, size_t from, CitationMatch& out) {
    for (size_t i = text.find_first_of("sS", from); i != std::string::npos; i = text.find_first_of("sS", i + 1)) {
        if (!KeywordAt(text, i)) continue;

        size_t start = i;
        if (i > from && IsDelimiter(text[i - 1])) {
            while (start > from && IsDelimiter(text[start - 1])) --start;
        } else if (i != 0) {
            continue;
        }

        const size_t captureStart = MatchTail(text, i);
        if (captureStart == std::string::npos) continue;

        out.start = start;
        out.captureStart = captureStart;
        out.end = std::min(text.find_first_of(".\n", captureStart), text.size());
        return true;
    }
    return false;
}

std::string StripClosingParens(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), ')'), text.end());
    return text;
}

} // namespace

std::string SourcesExtractor::parse(const std::string& text, const ReferenceFormatter& referenceFormatter) {
    return parse(text, referenceFormatter, nullptr);
}

std::string SourcesExtractor::parse(const std::string& text,
                                    const ReferenceFormatter& referenceFormatter,
                                    const SourceFormatter& spanFormatter) {
    if (!referenceFormatter) {
        throw std::invalid_argument("SourcesExtractor::parse: referenceFormatter cannot be empty.");
    }

    auto appendSpan = [&](std::string& out, size_t pos, size_t count) {
        if (spanFormatter) out.append(spanFormatter(text.substr(pos, count)));
        else out.append(text, pos, count);
    };

    std::string edited;
    edited.reserve(text.size());

    size_t lastEnd = 0;
    CitationMatch match;
    while (lastEnd <= text.size() && FindCitation(text, lastEnd, match)) {
        appendSpan(edited, lastEnd, match.start - lastEnd);
        edited.append(referenceFormatter(static_cast<int>(m_sources.size()) + 1));
        lastEnd = match.end;

        // A leading '(' is consumed as a delimiter but the matching ')' is not.
        m_sources.push_back(StripClosingParens(text.substr(match.captureStart, match.end - match.captureStart)));
    }

    appendSpan(edited, lastEnd, std::string::npos);
    return edited;
}

std::string SourcesExtractor::formatSources(const ReferenceFormatter& referenceFormatter,
                                            const SourceFormatter& sourceFormatter,
                                            const std::string& joinDelimiter) const {
    if (!referenceFormatter || !sourceFormatter) {
        throw std::invalid_argument("SourcesExtractor::formatSources: formatters cannot be empty.");
    }

    std::string formatted;
    for (size_t i = 0; i < m_sources.size(); ++i) {
        if (i > 0) {
            formatted += joinDelimiter;
        }
        formatted += referenceFormatter(static_cast<int>(i) + 1);
        formatted += sourceFormatter(m_sources[i]);
    }
    return formatted;
}

std::string SourcesExtractor::htmlReferenceFormat(int reference) {
    return "<sup>" + std::to_string(reference) + "</sup>";
}

} // namespace sourcemark::domain
