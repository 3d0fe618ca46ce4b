/**
 * @file CommandLine.hpp
 * @brief The sourcemark command: argument handling and the file-to-export run.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace sourcemark::app {

class CommandLine {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFileError = 1; ///< At least one input file was skipped.
    static constexpr int kExitUsage = 2;

    /**
     * @brief Runs the command.
     * @param args Arguments without the program name.
     * @param out Receives the rendered export (or the usage text for --help).
     * @param err Receives diagnostics.
     * @return One of the kExit* codes.
     */
    static int Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    static void PrintUsage(std::ostream& out);

    /** @brief Text processed when no input file is given. */
    static const char* SampleText();
};

} // namespace sourcemark::app
