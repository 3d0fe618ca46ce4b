/**
 * @file ReferenceFormats.hpp
 * @brief Reusable reference-marker and source-text formatters.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include "domain/RenderSettings.hpp"

namespace sourcemark::domain {

/** @brief Builds a marker from a 1-based citation number. */
using ReferenceFormatter = std::function<std::string(int)>;

/** @brief Transforms a citation text before it is rendered. */
using SourceFormatter = std::function<std::string(const std::string&)>;

class ReferenceFormats {
public:
    /** @brief Marker placed in the text in place of a citation. */
    static ReferenceFormatter ForStyle(ReferenceStyle style);

    /**
     * @brief Marker for a style as written in a given output format.
     *
     * LaTeX gets \textsuperscript{n} and \footnotemark[n] instead of the HTML
     * and Markdown markers; HTML footnotes link to the matching list item.
     * Markdown, Text and Json use ForStyle(style).
     */
    static ReferenceFormatter ForStyle(ReferenceStyle style, ExportFormat format);

    /** @brief Prefix placed in front of each entry of the references list. */
    static ReferenceFormatter ListPrefixForStyle(ReferenceStyle style);

    /** @brief Leaves the citation text as it is. */
    static SourceFormatter Identity();

    /** @brief Escapes &, <, >, " and ' for inclusion in HTML. */
    static std::string HtmlEscape(const std::string& text);

    /** @brief Escapes the LaTeX special characters & % $ # _ { } ~ ^ and backslash. */
    static std::string LatexEscape(const std::string& text);

    /** @brief Escaping applied to body text written in the given format (identity when none is needed). */
    static SourceFormatter BodyEscaperFor(ExportFormat format);

    static std::optional<ReferenceStyle> ParseStyle(const std::string& name);
    static std::string StyleName(ReferenceStyle style);

    static std::optional<ExportFormat> ParseExportFormat(const std::string& name);
    static std::string ExportFormatName(ExportFormat format);
};

} // namespace sourcemark::domain
