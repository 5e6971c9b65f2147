// =================================================================
// include/CodePack/StatsCalculator.hpp
// =================================================================
// Header for per-language statistics over a selection.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>

namespace CodePack {

class StatsCalculator {
public:
    /**
     * @brief Count files, lines and bytes per language
     *
     * Binary and unreadable files are left out. Languages are sorted by
     * line count, largest first, then by name.
     * @param file_paths Files to measure
     * @return Totals and per-language breakdown
     */
    static ProjectStats computeStats(const std::vector<std::string>& file_paths);

    /**
     * @brief Display language for a lowercase extension
     *
     * Unknown extensions map to themselves.
     */
    static std::string extensionToLanguage(const std::string& extension);

    /**
     * @brief Number of lines; a trailing newline does not start a new line
     */
    static size_t countLines(const std::string& content);
};

} // namespace CodePack
