/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/ReferenceFormats.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace sourcemark::infrastructure {

using domain::ReferenceFormats;

namespace {

const char* kSettingsFile = "settings.json";

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

domain::RenderSettings ConfigLoader::Load(const std::string& directory) {
    domain::RenderSettings settings;
    std::filesystem::path configPath = std::filesystem::path(directory) / kSettingsFile;
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return settings;
    }

    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not a JSON object. Using defaults." << std::endl;
        return settings;
    }

    std::string styleName;
    ReadKey(j, "reference_style", styleName);
    if (!styleName.empty()) {
        if (auto style = ReferenceFormats::ParseStyle(styleName)) {
            settings.style = *style;
        } else {
            std::cerr << "[ConfigLoader] Unknown reference_style '" << styleName << "'. Keeping "
                      << ReferenceFormats::StyleName(settings.style) << "." << std::endl;
        }
    }

    std::string formatName;
    ReadKey(j, "output_format", formatName);
    if (!formatName.empty()) {
        if (auto format = ReferenceFormats::ParseExportFormat(formatName)) {
            settings.outputFormat = *format;
        } else {
            std::cerr << "[ConfigLoader] Unknown output_format '" << formatName << "'. Keeping "
                      << ReferenceFormats::ExportFormatName(settings.outputFormat) << "." << std::endl;
        }
    }

    ReadKey(j, "join_delimiter", settings.joinDelimiter);
    ReadKey(j, "references_heading", settings.referencesHeading);
    ReadKey(j, "escape_sources", settings.escapeSources);

    return settings;
}

bool ConfigLoader::Save(const std::string& directory, const domain::RenderSettings& settings) {
    std::filesystem::path configPath = std::filesystem::path(directory) / kSettingsFile;
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Existing settings.json unreadable, overwriting: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["reference_style"] = ReferenceFormats::StyleName(settings.style);
    j["join_delimiter"] = settings.joinDelimiter;
    j["references_heading"] = settings.referencesHeading;
    j["escape_sources"] = settings.escapeSources;
    j["output_format"] = ReferenceFormats::ExportFormatName(settings.outputFormat);

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Failed to open settings.json for writing: " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    if (!f) {
        std::cerr << "[ConfigLoader] Write failed: " << configPath << std::endl;
        return false;
    }
    return true;
}

} // namespace sourcemark::infrastructure
