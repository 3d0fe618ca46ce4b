/**
 * @file ReferencesExportService.cpp
 * @brief Implementation of ReferencesExportService.
 */

#include "application/ReferencesExportService.hpp"
#include "domain/ReferenceFormats.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace sourcemark::application {

using domain::ReferenceFormats;

std::string ReferencesExportService::ToMarkdown(const std::vector<domain::Document>& documents,
                                                const CitationService& service) {
    std::stringstream ss;
    for (const auto& doc : documents) {
        if (!doc.title.empty()) ss << "# " << doc.title << "\n\n";
        ss << doc.body << "\n\n";
    }

    if (!service.getSources().empty()) {
        ss << "## " << service.getSettings().referencesHeading << "\n\n";
        ss << service.renderReferences() << "\n";
    }
    return ss.str();
}

std::string ReferencesExportService::ToHtml(const std::vector<domain::Document>& documents,
                                            const CitationService& service) {
    std::stringstream ss;
    for (const auto& doc : documents) {
        ss << "<article>\n";
        if (!doc.title.empty()) ss << "  <h1>" << ReferenceFormats::HtmlEscape(doc.title) << "</h1>\n";
        ss << "  <p>" << doc.body << "</p>\n";
        ss << "</article>\n";
    }

    const auto& sources = service.getSources();
    if (!sources.empty()) {
        ss << "<section class=\"references\">\n";
        ss << "  <h2>" << ReferenceFormats::HtmlEscape(service.getSettings().referencesHeading) << "</h2>\n";
        ss << "  <ol>\n";
        for (size_t i = 0; i < sources.size(); ++i) {
            ss << "    <li id=\"ref-" << (i + 1) << "\">" << ReferenceFormats::HtmlEscape(sources[i]) << "</li>\n";
        }
        ss << "  </ol>\n";
        ss << "</section>\n";
    }
    return ss.str();
}

std::string ReferencesExportService::ToLatex(const std::vector<domain::Document>& documents,
                                             const CitationService& service) {
    std::stringstream ss;
    for (const auto& doc : documents) {
        if (!doc.title.empty()) ss << "\\section*{" << ReferenceFormats::LatexEscape(doc.title) << "}\n";
        ss << doc.body << "\n\n";
    }

    const auto& sources = service.getSources();
    if (!sources.empty()) {
        // article uses \refname, book and report use \bibname.
        const std::string heading = ReferenceFormats::LatexEscape(service.getSettings().referencesHeading);
        ss << "\\providecommand{\\refname}{}\\providecommand{\\bibname}{}\n";
        ss << "\\renewcommand{\\refname}{" << heading << "}\n";
        ss << "\\renewcommand{\\bibname}{" << heading << "}\n";
        ss << "\\begin{thebibliography}{" << sources.size() << "}\n";
        for (size_t i = 0; i < sources.size(); ++i) {
            ss << "\\bibitem{ref" << (i + 1) << "} " << ReferenceFormats::LatexEscape(sources[i]) << "\n";
        }
        ss << "\\end{thebibliography}\n";
    }
    return ss.str();
}

std::string ReferencesExportService::ToText(const std::vector<domain::Document>& documents,
                                            const CitationService& service) {
    std::stringstream ss;
    for (const auto& doc : documents) {
        if (!doc.title.empty()) {
            ss << doc.title << "\n" << std::string(doc.title.size(), '=') << "\n\n";
        }
        ss << doc.body << "\n\n";
    }

    if (!service.getSources().empty()) {
        const std::string& heading = service.getSettings().referencesHeading;
        ss << heading << "\n" << std::string(heading.size(), '-') << "\n";
        ss << service.renderReferences() << "\n";
    }
    return ss.str();
}

std::string ReferencesExportService::ToJson(const std::vector<domain::Document>& documents,
                                            const CitationService& service) {
    nlohmann::json j;
    j["documents"] = nlohmann::json::array();
    for (const auto& doc : documents) {
        j["documents"].push_back({{"title", doc.title}, {"body", doc.body}});
    }
    j["sources"] = service.getSources();
    j["reference_style"] = ReferenceFormats::StyleName(service.getSettings().style);
    // Input files are not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    return j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ReferencesExportService::Render(domain::ExportFormat format,
                                            const std::vector<domain::Document>& documents,
                                            const CitationService& service) {
    switch (format) {
        case domain::ExportFormat::Html: return ToHtml(documents, service);
        case domain::ExportFormat::Latex: return ToLatex(documents, service);
        case domain::ExportFormat::Text: return ToText(documents, service);
        case domain::ExportFormat::Json: return ToJson(documents, service);
        case domain::ExportFormat::Markdown:
        default: return ToMarkdown(documents, service);
    }
}

} // namespace sourcemark::application
