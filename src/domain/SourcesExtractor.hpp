/**
 * @file SourcesExtractor.hpp
 * @brief Extracts inline "Source: ..." citations from text and numbers them.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ReferenceFormats.hpp"

namespace sourcemark::domain {

/**
 * @class SourcesExtractor
 * @brief Replaces inline source citations with reference markers and keeps the
 * extracted citations in discovery order.
 *
 * The same instance can parse several texts: numbering continues across calls,
 * so the accumulated list forms a single references table.
 *
 * Not thread-safe. Use one instance per thread or serialize access.
 */
class SourcesExtractor {
public:
    SourcesExtractor() = default;

    /**
     * @brief Parses the text, replacing each citation with a formatted marker.
     * @param text Text to process. Any string is accepted.
     * @param referenceFormatter Builds the marker from the 1-based citation number.
     * @return The text with every citation replaced, all other characters untouched.
     * @throws std::invalid_argument if referenceFormatter is empty.
     */
    std::string parse(const std::string& text, const ReferenceFormatter& referenceFormatter);

    /**
     * @brief Same as parse(text, referenceFormatter), but every span of text
     * outside the citations is passed through spanFormatter first (for example
     * to escape it for the output format). Markers and extracted citations are
     * not affected. An empty spanFormatter copies spans verbatim.
     */
    std::string parse(const std::string& text,
                      const ReferenceFormatter& referenceFormatter,
                      const SourceFormatter& spanFormatter);

    /** @brief Returns the citations extracted so far, in discovery order. */
    const std::vector<std::string>& getSources() const { return m_sources; }

    /**
     * @brief Renders the accumulated citations as a single string.
     * @param referenceFormatter Prefix built from the 1-based citation number.
     * @param sourceFormatter Transformation applied to each citation text.
     * @param joinDelimiter Inserted between entries (never leading or trailing).
     * @return The joined list, or an empty string when nothing was extracted.
     * @throws std::invalid_argument if either formatter is empty.
     */
    std::string formatSources(const ReferenceFormatter& referenceFormatter,
                              const SourceFormatter& sourceFormatter,
                              const std::string& joinDelimiter) const;

    /** @brief Formats a reference number as an HTML superscript, e.g. "<sup>3</sup>". */
    static std::string htmlReferenceFormat(int reference);

private:
    std::vector<std::string> m_sources;
};

} // namespace sourcemark::domain
