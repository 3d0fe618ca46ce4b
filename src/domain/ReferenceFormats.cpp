/**
 * @file ReferenceFormats.cpp
 * @brief Implementation of ReferenceFormats.
 */

#include "domain/ReferenceFormats.hpp"
#include "domain/SourcesExtractor.hpp"
#include <cctype>

namespace sourcemark::domain {

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        if (!std::isspace(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace

ReferenceFormatter ReferenceFormats::ForStyle(ReferenceStyle style) {
    switch (style) {
        case ReferenceStyle::Bracket:
            return [](int n) { return "[" + std::to_string(n) + "]"; };
        case ReferenceStyle::Parenthesis:
            return [](int n) { return " (" + std::to_string(n) + ")"; };
        case ReferenceStyle::Footnote:
            return [](int n) { return "[^" + std::to_string(n) + "]"; };
        case ReferenceStyle::Superscript:
        default:
            return &SourcesExtractor::htmlReferenceFormat;
    }
}

ReferenceFormatter ReferenceFormats::ForStyle(ReferenceStyle style, ExportFormat format) {
    if (format == ExportFormat::Latex) {
        switch (style) {
            case ReferenceStyle::Superscript:
                return [](int n) { return "\\textsuperscript{" + std::to_string(n) + "}"; };
            case ReferenceStyle::Footnote:
                return [](int n) { return "\\footnotemark[" + std::to_string(n) + "]"; };
            default:
                break;
        }
    } else if (format == ExportFormat::Html && style == ReferenceStyle::Footnote) {
        return [](int n) {
            const std::string num = std::to_string(n);
            return "<sup><a href=\"#ref-" + num + "\">" + num + "</a></sup>";
        };
    }
    return ForStyle(style);
}

ReferenceFormatter ReferenceFormats::ListPrefixForStyle(ReferenceStyle style) {
    switch (style) {
        case ReferenceStyle::Bracket:
            return [](int n) { return "[" + std::to_string(n) + "] "; };
        case ReferenceStyle::Parenthesis:
            return [](int n) { return "(" + std::to_string(n) + ") "; };
        case ReferenceStyle::Footnote:
            return [](int n) { return "[^" + std::to_string(n) + "]: "; };
        case ReferenceStyle::Superscript:
        default:
            return [](int n) { return SourcesExtractor::htmlReferenceFormat(n) + " "; };
    }
}

SourceFormatter ReferenceFormats::Identity() {
    return [](const std::string& text) { return text; };
}

std::string ReferenceFormats::HtmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string ReferenceFormats::LatexEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': case '%': case '$': case '#': case '_': case '{': case '}':
                out.push_back('\\');
                out.push_back(c);
                break;
            case '~': out += "\\textasciitilde{}"; break;
            case '^': out += "\\textasciicircum{}"; break;
            case '\\': out += "\\textbackslash{}"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

SourceFormatter ReferenceFormats::BodyEscaperFor(ExportFormat format) {
    switch (format) {
        case ExportFormat::Html: return &ReferenceFormats::HtmlEscape;
        case ExportFormat::Latex: return &ReferenceFormats::LatexEscape;
        default: return Identity();
    }
}

std::optional<ReferenceStyle> ReferenceFormats::ParseStyle(const std::string& name) {
    const std::string norm = Normalize(name);
    if (norm == "superscript" || norm == "sup") return ReferenceStyle::Superscript;
    if (norm == "bracket") return ReferenceStyle::Bracket;
    if (norm == "parenthesis") return ReferenceStyle::Parenthesis;
    if (norm == "footnote") return ReferenceStyle::Footnote;
    return std::nullopt;
}

std::string ReferenceFormats::StyleName(ReferenceStyle style) {
    switch (style) {
        case ReferenceStyle::Bracket: return "bracket";
        case ReferenceStyle::Parenthesis: return "parenthesis";
        case ReferenceStyle::Footnote: return "footnote";
        case ReferenceStyle::Superscript:
        default: return "superscript";
    }
}

std::optional<ExportFormat> ReferenceFormats::ParseExportFormat(const std::string& name) {
    const std::string norm = Normalize(name);
    if (norm == "markdown" || norm == "md") return ExportFormat::Markdown;
    if (norm == "html") return ExportFormat::Html;
    if (norm == "latex" || norm == "tex") return ExportFormat::Latex;
    if (norm == "text" || norm == "txt") return ExportFormat::Text;
    if (norm == "json") return ExportFormat::Json;
    return std::nullopt;
}

std::string ReferenceFormats::ExportFormatName(ExportFormat format) {
    switch (format) {
        case ExportFormat::Html: return "html";
        case ExportFormat::Latex: return "latex";
        case ExportFormat::Text: return "text";
        case ExportFormat::Json: return "json";
        case ExportFormat::Markdown:
        default: return "markdown";
    }
}

} // namespace sourcemark::domain
