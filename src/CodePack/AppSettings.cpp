// =================================================================
// src/CodePack/AppSettings.cpp
// =================================================================
// Implementation for the effective settings.

#include "CodePack/AppSettings.hpp"
#include "CodePack/ConfigParser.hpp"
#include "CodePack/CliParser.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace CodePack {

static bool parseSize(const std::string& text, size_t& value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        value = static_cast<size_t>(std::stoull(text));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseBool(const std::string& text, bool& value) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        value = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        value = false;
        return true;
    }
    return false;
}

void AppSettings::loadFromConfig(const ConfigParser& config) {
    auto readSize = [&config](const std::string& key, size_t& target) {
        if (!config.hasKey(key)) {
            return;
        }
        if (!parseSize(config.getStringValue(key), target)) {
            LOG_WARNING("AppSettings", "Ignoring non-numeric value for " + key, config.getStringValue(key));
        }
    };
    auto readBool = [&config](const std::string& key, bool& target) {
        if (!config.hasKey(key)) {
            return;
        }
        if (!parseBool(config.getStringValue(key), target)) {
            LOG_WARNING("AppSettings", "Ignoring non-boolean value for " + key, config.getStringValue(key));
        }
    };
    auto readString = [&config](const std::string& key, std::string& target) {
        std::string value = config.getStringValue(key);
        if (!value.empty()) {
            target = value;
        }
    };

    readSize("pack.max_file_bytes", pack_max_file_bytes);
    readString("pack.format", pack_format);
    readBool("pack.mask_secrets", pack_mask_secrets);

    readBool("scan.include_hidden", scan_include_hidden);
    readSize("scan.max_file_bytes", scan_max_file_bytes);
    if (config.hasKey("scan.exclude")) {
        scan_exclude = config.getStringList("scan.exclude");
    }

    readString("paths.config_file", config_file);
    readString("paths.plugins_dir", plugins_dir);

    readString("log.dir", log_dir);
    readString("log.level", log_level);
}

void AppSettings::applyCommandOverrides(const Commands& commands) {
    if (!commands.format.empty()) {
        pack_format = commands.format;
    }
    if (commands.max_file_bytes > 0) {
        pack_max_file_bytes = commands.max_file_bytes;
    }
    if (commands.mask_secrets) {
        pack_mask_secrets = true;
    }
    if (commands.verbose) {
        log_level = "debug";
    } else if (commands.quiet) {
        log_level = "error";
    }
}

bool AppSettings::validate(std::string& error) const {
    if (pack_max_file_bytes == 0) {
        error = "pack.max_file_bytes must be greater than zero";
        return false;
    }
    ExportFormat format;
    if (!parseExportFormat(pack_format, format)) {
        error = "Unknown pack.format '" + pack_format + "' (expected plain, markdown or xml)";
        return false;
    }
    LogLevel level;
    if (!Logger::parseLevel(log_level, level)) {
        error = "Unknown log.level '" + log_level + "'";
        return false;
    }
    if (config_file.empty() || plugins_dir.empty()) {
        error = "paths.config_file and paths.plugins_dir must not be empty";
        return false;
    }
    return true;
}

ExportFormat AppSettings::exportFormat() const {
    ExportFormat format = ExportFormat::Plain;
    parseExportFormat(pack_format, format);
    return format;
}

ScanOptions AppSettings::toScanOptions() const {
    ScanOptions options;
    options.include_hidden = scan_include_hidden;
    options.max_file_bytes = scan_max_file_bytes;
    options.exclude_rules = scan_exclude;
    return options;
}

std::string AppSettings::defaultConfigYaml() {
    return R"(# CodePack Configuration v1.0

# Packing defaults; command-line flags take precedence
pack:
  max_file_bytes: 1048576   # Files above this size are skipped with a placeholder
  format: plain             # plain, markdown or xml
  mask_secrets: false

# Tree scanning
scan:
  include_hidden: false
  max_file_bytes: 0         # 0 keeps every file in the tree
  exclude:                  # Added to the built-in exclusions
    - '*.min.js'
    - 'vendor/'

# Storage locations
paths:
  config_file: .codepack/projects.json
  plugins_dir: .codepack/plugins

# Logging
log:
  dir: .codepack/logs
  level: info               # debug, info, warning, error or critical
)";
}

} // namespace CodePack
