/**
 * @file CitationService.cpp
 * @brief Implementation of CitationService.
 */

#include "application/CitationService.hpp"
#include "domain/ReferenceFormats.hpp"
#include <iostream>

namespace sourcemark::application {

using domain::ReferenceFormats;

CitationService::CitationService(domain::RenderSettings settings)
    : m_settings(std::move(settings)) {}

domain::Document CitationService::processDocument(const domain::Document& document) {
    const size_t before = m_extractor.getSources().size();

    domain::Document processed;
    processed.title = document.title;
    processed.body = m_extractor.parse(document.body,
                                       ReferenceFormats::ForStyle(m_settings.style, m_settings.outputFormat),
                                       ReferenceFormats::BodyEscaperFor(m_settings.outputFormat));

    const size_t found = m_extractor.getSources().size() - before;
    // stdout carries the rendered export, so progress goes to the log stream.
    std::clog << "[CitationService] " << (document.title.empty() ? "<untitled>" : document.title)
              << ": " << found << " citation(s) extracted." << std::endl;
    return processed;
}

std::vector<domain::Document> CitationService::processAll(const std::vector<domain::Document>& documents) {
    std::vector<domain::Document> processed;
    processed.reserve(documents.size());
    for (const auto& doc : documents) {
        processed.push_back(processDocument(doc));
    }
    return processed;
}

std::string CitationService::renderReferences() const {
    domain::SourceFormatter sourceFormatter = m_settings.escapeSources
        ? domain::SourceFormatter(&ReferenceFormats::HtmlEscape)
        : ReferenceFormats::Identity();
    return m_extractor.formatSources(ReferenceFormats::ListPrefixForStyle(m_settings.style),
                                     sourceFormatter,
                                     m_settings.joinDelimiter);
}

} // namespace sourcemark::application
