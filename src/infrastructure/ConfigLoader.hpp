/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving rendering settings (settings.json).
 *
 * Keeps JSON parsing of the user configuration in one place. Recognized keys:
 * reference_style, join_delimiter, references_heading, escape_sources,
 * output_format.
 */

#pragma once

#include <string>
#include "domain/RenderSettings.hpp"

namespace sourcemark::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the given directory.
     * @param directory Directory containing settings.json.
     * @return The settings found, defaults for anything missing or invalid.
     */
    static domain::RenderSettings Load(const std::string& directory);

    /**
     * @brief Writes the settings to settings.json, preserving keys it does not own.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& directory, const domain::RenderSettings& settings);
};

} // namespace sourcemark::infrastructure
