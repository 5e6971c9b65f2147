// =================================================================
// include/CodePack/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <string>
#include <vector>
#include <utility> // For std::pair

namespace CodePack {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string (binary-safe).
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Replaces a file's content in a single atomic step.
     *
     * The content is written to a temporary sibling file which is then
     * renamed over the target, so readers never observe a partial write.
     * Missing parent directories are created.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFileAtomic(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Creates a directory and any missing parents.
     */
    bool createDirectories(const std::string& dir_path);

    /**
     * @brief Removes a single file.
     * @return True if the file was removed.
     */
    bool removeFile(const std::string& file_path);

    /**
     * @brief Executes an external command and captures its output.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @return A pair containing stdout and the exit code.
     */
    std::pair<std::string, int> executeCommand(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Heuristic binary check: a NUL byte or invalid UTF-8.
     * @param content Raw file bytes.
     * @return True if the content should be treated as binary.
     */
    static bool isBinaryContent(const std::string& content);

    /**
     * @brief Validates UTF-8 encoding (rejects overlongs and surrogates).
     */
    static bool isValidUtf8(const std::string& content);
};

} // namespace CodePack
