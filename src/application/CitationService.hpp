/**
 * @file CitationService.hpp
 * @brief Runs documents through a single SourcesExtractor with configured styles.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Document.hpp"
#include "domain/RenderSettings.hpp"
#include "domain/SourcesExtractor.hpp"

namespace sourcemark::application {

/**
 * @class CitationService
 * @brief Builds one references table out of any number of documents.
 *
 * Citation numbers are global to the service: the first citation of the
 * second document follows the last citation of the first one.
 */
class CitationService {
public:
    explicit CitationService(domain::RenderSettings settings = {});

    /**
     * @brief Replaces the citations of a document with markers in the configured style.
     *
     * The body is written for the configured output format: markers use that
     * format's syntax and the surrounding text is escaped for it (HTML, LaTeX).
     * @return A copy of the document with the rewritten body.
     */
    domain::Document processDocument(const domain::Document& document);

    /** @brief Processes documents in order. */
    std::vector<domain::Document> processAll(const std::vector<domain::Document>& documents);

    /** @brief Renders the references list (prefix per style, joined by the configured delimiter). */
    std::string renderReferences() const;

    const std::vector<std::string>& getSources() const { return m_extractor.getSources(); }
    const domain::RenderSettings& getSettings() const { return m_settings; }

private:
    domain::RenderSettings m_settings;
    domain::SourcesExtractor m_extractor;
};

} // namespace sourcemark::application
