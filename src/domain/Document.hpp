/**
 * @file Document.hpp
 * @brief Value type for a titled piece of text processed by the citation pipeline.
 */

#pragma once

#include <string>

namespace sourcemark::domain {

/**
 * @struct Document
 * @brief A named text whose inline citations are to be extracted.
 */
struct Document {
    std::string title; ///< Display title (the CLI uses the file name).
    std::string body;  ///< Raw text, or the rewritten text once processed.
};

} // namespace sourcemark::domain
