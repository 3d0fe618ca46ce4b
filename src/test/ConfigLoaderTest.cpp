#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentExtractor.hpp"

using namespace sourcemark::domain;
using namespace sourcemark::infrastructure;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_project_root_config";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    const auto settingsPath = std::filesystem::path(testRoot) / "settings.json";

    // Missing file
    RenderSettings defaults = ConfigLoader::Load(testRoot);
    assert(defaults.style == ReferenceStyle::Superscript);
    assert(defaults.joinDelimiter == "\n");
    assert(defaults.referencesHeading == "References");
    assert(!defaults.escapeSources);
    assert(defaults.outputFormat == ExportFormat::Markdown);

    // Every key
    WriteFile(settingsPath, R"({
        "reference_style": "footnote",
        "join_delimiter": "; ",
        "references_heading": "Sources",
        "escape_sources": true,
        "output_format": "html",
        "theme": "dark"
    })");
    RenderSettings loaded = ConfigLoader::Load(testRoot);
    assert(loaded.style == ReferenceStyle::Footnote);
    assert(loaded.joinDelimiter == "; ");
    assert(loaded.referencesHeading == "Sources");
    assert(loaded.escapeSources);
    assert(loaded.outputFormat == ExportFormat::Html);

    // Invalid values fall back per key
    WriteFile(settingsPath, R"({"reference_style": "roman", "escape_sources": "yes", "references_heading": "Bibliografia"})");
    RenderSettings partial = ConfigLoader::Load(testRoot);
    assert(partial.style == ReferenceStyle::Superscript);
    assert(!partial.escapeSources);
    assert(partial.referencesHeading == "Bibliografia");

    // Malformed JSON
    WriteFile(settingsPath, "{ not json");
    RenderSettings malformed = ConfigLoader::Load(testRoot);
    assert(malformed.style == ReferenceStyle::Superscript);

    // Save keeps unrelated keys
    WriteFile(settingsPath, R"({"theme": "dark"})");
    RenderSettings toSave;
    toSave.style = ReferenceStyle::Bracket;
    toSave.outputFormat = ExportFormat::Latex;
    toSave.joinDelimiter = " | ";
    assert(ConfigLoader::Save(testRoot, toSave));

    std::ifstream in(settingsPath);
    nlohmann::json saved;
    in >> saved;
    assert(saved["theme"] == "dark");
    assert(saved["reference_style"] == "bracket");
    assert(saved["output_format"] == "latex");

    RenderSettings reloaded = ConfigLoader::Load(testRoot);
    assert(reloaded.style == ReferenceStyle::Bracket);
    assert(reloaded.outputFormat == ExportFormat::Latex);
    assert(reloaded.joinDelimiter == " | ");

    // Input files
    const auto notePath = std::filesystem::path(testRoot) / "note.md";
    WriteFile(notePath, "\xEF\xBB\xBFSource: first line");
    auto extracted = ContentExtractor::ExtractText(notePath.string());
    assert(extracted.success);
    assert(extracted.content == "Source: first line");
    assert(extracted.method == "text-read");

    auto missing = ContentExtractor::ExtractText((std::filesystem::path(testRoot) / "missing.txt").string());
    assert(!missing.success);
    assert(!missing.warnings.empty());

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
