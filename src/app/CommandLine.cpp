/**
 * @file CommandLine.cpp
 * @brief Implementation of CommandLine.
 */

#include "app/CommandLine.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

#include "application/CitationService.hpp"
#include "application/ReferencesExportService.hpp"
#include "domain/ReferenceFormats.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentExtractor.hpp"

namespace sourcemark::app {

namespace fs = std::filesystem;

namespace {

struct CliOptions {
    std::string configDir = ".";
    std::string format;
    std::string style;
    std::vector<std::string> files;
    bool showHelp = false;
};

// Returns false on bad usage.
bool ParseArgs(const std::vector<std::string>& args, CliOptions& options, std::ostream& err) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return true;
        }
        if (arg == "--config" || arg == "--format" || arg == "--style") {
            if (i + 1 >= args.size()) {
                err << "[sourcemark] Missing value for " << arg << std::endl;
                return false;
            }
            const std::string& value = args[++i];
            if (arg == "--config") options.configDir = value;
            else if (arg == "--format") options.format = value;
            else options.style = value;
        } else if (arg.size() > 1 && arg[0] == '-') {
            err << "[sourcemark] Unknown option: " << arg << std::endl;
            return false;
        } else {
            options.files.push_back(arg);
        }
    }
    return true;
}

} // namespace

const char* CommandLine::SampleText() {
    return "This is some dummy text. Source: a nice book. Here is more text.\n"
           "Citations may also be written in parentheses (sources: my own notes).";
}

void CommandLine::PrintUsage(std::ostream& out) {
    out << "Usage: sourcemark [options] [FILE...]\n"
        << "Replaces inline 'Source: ...' citations with numbered markers and\n"
        << "appends a references section.\n\n"
        << "Options:\n"
        << "  --config DIR     Directory containing settings.json (default: .)\n"
        << "  --format FMT     markdown | html | latex | text | json\n"
        << "  --style STYLE    superscript | bracket | parenthesis | footnote\n"
        << "  --help           Show this message\n\n"
        << "Without FILE, a built-in sample text is processed.\n";
}

int CommandLine::Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    CliOptions options;
    if (!ParseArgs(args, options, err)) {
        PrintUsage(err);
        return kExitUsage;
    }
    if (options.showHelp) {
        PrintUsage(out);
        return kExitOk;
    }

    domain::RenderSettings settings = infrastructure::ConfigLoader::Load(options.configDir);

    // Flags override settings.json.
    if (!options.style.empty()) {
        auto style = domain::ReferenceFormats::ParseStyle(options.style);
        if (!style) {
            err << "[sourcemark] Unknown style: " << options.style << std::endl;
            return kExitUsage;
        }
        settings.style = *style;
    }
    if (!options.format.empty()) {
        auto format = domain::ReferenceFormats::ParseExportFormat(options.format);
        if (!format) {
            err << "[sourcemark] Unknown format: " << options.format << std::endl;
            return kExitUsage;
        }
        settings.outputFormat = *format;
    }

    std::vector<domain::Document> documents;
    bool hadFailure = false;

    if (options.files.empty()) {
        documents.push_back({"Sample", SampleText()});
    } else {
        for (const auto& path : options.files) {
            auto result = infrastructure::ContentExtractor::ExtractText(path);
            for (const auto& warning : result.warnings) {
                err << "[sourcemark] " << warning << std::endl;
            }
            if (!result.success) {
                hadFailure = true;
                continue;
            }
            documents.push_back({fs::path(path).filename().string(), result.content});
        }
    }

    application::CitationService service(settings);
    auto processed = service.processAll(documents);

    try {
        out << application::ReferencesExportService::Render(settings.outputFormat, processed, service);
    } catch (const nlohmann::json::exception& e) {
        err << "[sourcemark] Failed to render output: " << e.what() << std::endl;
        return kExitFileError;
    }
    out.flush();

    return hadFailure ? kExitFileError : kExitOk;
}

} // namespace sourcemark::app
