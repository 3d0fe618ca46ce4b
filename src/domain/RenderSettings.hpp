/**
 * @file RenderSettings.hpp
 * @brief Presentation options for reference markers and the references section.
 */

#pragma once

#include <string>

namespace sourcemark::domain {

/**
 * @enum ReferenceStyle
 * @brief How a citation number is rendered in the text.
 */
enum class ReferenceStyle {
    Superscript, ///< <sup>n</sup>
    Bracket,     ///< [n]
    Parenthesis, ///< " (n)"
    Footnote     ///< [^n] (Markdown footnote)
};

/**
 * @enum ExportFormat
 * @brief Output document format for processed texts and their references.
 */
enum class ExportFormat {
    Markdown,
    Html,
    Latex,
    Text,
    Json
};

/**
 * @struct RenderSettings
 * @brief User-configurable rendering options (see ConfigLoader).
 */
struct RenderSettings {
    ReferenceStyle style = ReferenceStyle::Superscript;
    std::string joinDelimiter = "\n";
    std::string referencesHeading = "References";
    bool escapeSources = false; ///< HTML-escape citation texts in the rendered list.
    ExportFormat outputFormat = ExportFormat::Markdown;
};

} // namespace sourcemark::domain
