// =================================================================
// src/CodePack/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "CodePack/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <cstdio>
#include <memory>
#include <array>
#include <unistd.h>

#if defined(_WIN32)
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

namespace CodePack {

namespace fs = std::filesystem;

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

bool SysInteraction::writeFileAtomic(const std::string& file_path, const std::string& content) {
    fs::path target(file_path);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    fs::path temp = target;
    temp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream file_stream(temp, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            return false;
        }
        file_stream << content;
        file_stream.flush();
        if (!file_stream.good()) {
            file_stream.close();
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return false;
    }
    return true;
}

bool SysInteraction::fileExists(const std::string& file_path) {
    std::error_code ec;
    return fs::is_regular_file(file_path, ec);
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    std::error_code ec;
    return fs::is_directory(dir_path, ec);
}

bool SysInteraction::createDirectories(const std::string& dir_path) {
    std::error_code ec;
    fs::create_directories(dir_path, ec);
    return !ec && fs::is_directory(dir_path, ec);
}

bool SysInteraction::removeFile(const std::string& file_path) {
    std::error_code ec;
    return fs::remove(file_path, ec) && !ec;
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    std::string full_command = command;
    for (const auto& arg : args) {
        // Single-quote every argument; embedded quotes are closed, escaped and reopened
        std::string quoted = "'";
        for (char c : arg) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted += c;
            }
        }
        quoted += "'";
        full_command += " " + quoted;
    }

    // Keep stderr out of the parsed output
    full_command += " 2>/dev/null";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + full_command);
    }

    std::array<char, 4096> buffer;
    std::string result;
    size_t bytes_read = 0;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.append(buffer.data(), bytes_read);
    }

    int exit_status = pclose(pipe.release());

#if !defined(_WIN32)
    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        exit_status = -1;
    }
#endif

    return {result, exit_status};
}

bool SysInteraction::isBinaryContent(const std::string& content) {
    if (content.find('\0') != std::string::npos) {
        return true;
    }
    return !isValidUtf8(content);
}

bool SysInteraction::isValidUtf8(const std::string& content) {
    size_t length = content.size();
    size_t i = 0;

    while (i < length) {
        unsigned char lead = static_cast<unsigned char>(content[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        unsigned int code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= length) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char next = static_cast<unsigned char>(content[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

} // namespace CodePack
