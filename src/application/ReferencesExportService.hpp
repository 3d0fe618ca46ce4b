/**
 * @file ReferencesExportService.hpp
 * @brief Renders processed documents followed by their references section.
 */

#pragma once

#include <string>
#include <vector>
#include "application/CitationService.hpp"
#include "domain/Document.hpp"
#include "domain/RenderSettings.hpp"

namespace sourcemark::application {

/**
 * Every renderer expects documents already processed by the given service,
 * with the service's outputFormat matching the renderer: bodies are written as
 * they are, since CitationService already escaped them for that format.
 * The references section is omitted when no citation was found (JSON keeps an
 * empty "sources" array).
 */
class ReferencesExportService {
public:
    static std::string ToMarkdown(const std::vector<domain::Document>& documents, const CitationService& service);
    static std::string ToHtml(const std::vector<domain::Document>& documents, const CitationService& service);
    static std::string ToLatex(const std::vector<domain::Document>& documents, const CitationService& service);
    static std::string ToText(const std::vector<domain::Document>& documents, const CitationService& service);
    static std::string ToJson(const std::vector<domain::Document>& documents, const CitationService& service);

    /** @brief Dispatches to the renderer matching the format. */
    static std::string Render(domain::ExportFormat format,
                              const std::vector<domain::Document>& documents,
                              const CitationService& service);
};

} // namespace sourcemark::application
