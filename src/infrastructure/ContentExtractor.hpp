/**
 * @file ContentExtractor.hpp
 * @brief Utility for reading the text of input documents.
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace sourcemark::infrastructure {

class ContentExtractor {
public:
    struct ExtractionResult {
        std::string content;
        bool success = false;
        std::string method; // "text-read", "failed"
        std::vector<std::string> warnings;
    };

    static ExtractionResult ExtractText(const std::string& path) {
        ExtractionResult result;
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            result.method = "failed";
            result.warnings.push_back("Path is a directory: " + path);
            return result;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            result.method = "failed";
            result.warnings.push_back("Could not open file: " + path);
            return result;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        result.content = buffer.str();

        // Strip a UTF-8 BOM so a citation at the very start still matches "^".
        if (result.content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            result.content.erase(0, 3);
            result.warnings.push_back("UTF-8 byte order mark removed.");
        }

        result.success = true;
        result.method = "text-read";
        return result;
    }
};

} // namespace sourcemark::infrastructure
