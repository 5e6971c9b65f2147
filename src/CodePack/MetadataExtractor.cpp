// =================================================================
// src/CodePack/MetadataExtractor.cpp
// =================================================================
// Implementation for manifest parsing.

#include "CodePack/MetadataExtractor.hpp"
#include "CodePack/Logger.hpp"
#include "CodePack/SysInteraction.hpp"
#include "nlohmann/json.hpp"
#include <yaml-cpp/yaml.h>
#include <sstream>
#include <algorithm>
#include <unordered_set>
#include <utility>

namespace CodePack {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string stripQuotes(const std::string& s) {
    std::string result = trim(s);
    if (result.size() >= 2 &&
        ((result.front() == '"' && result.back() == '"') ||
         (result.front() == '\'' && result.back() == '\''))) {
        result = result.substr(1, result.size() - 2);
    }
    return result;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool readText(const fs::path& path, std::string& content) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    SysInteraction sys;
    try {
        content = sys.readFile(path.string());
        return true;
    } catch (const std::exception& e) {
        LOG_WARNING("MetadataExtractor", "Cannot read manifest", e.what());
        return false;
    }
}

// ----------------------------------------------------------------
// Minimal TOML reader: tables, strings, string arrays, inline tables.
// ----------------------------------------------------------------

struct TomlValue {
    enum class Kind { String, Array, Table, Other };
    Kind kind = Kind::Other;
    std::string text;
    std::vector<std::string> items;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct TomlEntry {
    std::string key;
    TomlValue value;
};

class TomlReader {
public:
    explicit TomlReader(const std::string& text) {
        m_sections.push_back({"", {}});
        parse(text);
    }

    const std::vector<TomlEntry>* section(const std::string& name) const {
        for (const auto& sec : m_sections) {
            if (sec.first == name) {
                return &sec.second;
            }
        }
        return nullptr;
    }

    const TomlValue* find(const std::string& section_name, const std::string& key) const {
        const auto* entries = section(section_name);
        if (!entries) {
            return nullptr;
        }
        for (const auto& entry : *entries) {
            if (entry.key == key) {
                return &entry.value;
            }
        }
        return nullptr;
    }

    std::string getString(const std::string& section_name, const std::string& key) const {
        const TomlValue* value = find(section_name, key);
        if (value && value->kind == TomlValue::Kind::String) {
            return value->text;
        }
        return "";
    }

    std::vector<std::string> sectionNames() const {
        std::vector<std::string> names;
        for (const auto& sec : m_sections) {
            names.push_back(sec.first);
        }
        return names;
    }

private:
    std::vector<std::pair<std::string, std::vector<TomlEntry>>> m_sections;

    std::vector<TomlEntry>& ensureSection(const std::string& name) {
        for (auto& sec : m_sections) {
            if (sec.first == name) {
                return sec.second;
            }
        }
        m_sections.push_back({name, {}});
        return m_sections.back().second;
    }

    static std::string stripComment(const std::string& line) {
        char quote = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote) {
                if (c == '\\' && quote == '"') {
                    ++i;
                } else if (c == quote) {
                    quote = 0;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#') {
                return line.substr(0, i);
            }
        }
        return line;
    }

    static bool isTripleQuoted(const std::string& value) {
        return startsWith(value, "\"\"\"") || startsWith(value, "'''");
    }

    static bool isComplete(const std::string& value) {
        if (isTripleQuoted(value)) {
            return value.find(value.substr(0, 3), 3) != std::string::npos;
        }
        int depth = 0;
        char quote = 0;
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (quote) {
                if (c == '\\' && quote == '"') {
                    ++i;
                } else if (c == quote) {
                    quote = 0;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '[' || c == '{') {
                ++depth;
            } else if (c == ']' || c == '}') {
                --depth;
            }
        }
        return depth <= 0 && quote == 0;
    }

    static std::string parseQuoted(const std::string& s, size_t& pos) {
        char quote = s[pos++];
        std::string out;
        while (pos < s.size() && s[pos] != quote) {
            char c = s[pos];
            if (quote == '"' && c == '\\' && pos + 1 < s.size()) {
                char next = s[pos + 1];
                switch (next) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    default: out += next; break;
                }
                pos += 2;
                continue;
            }
            out += c;
            ++pos;
        }
        if (pos < s.size()) {
            ++pos; // closing quote
        }
        return out;
    }

    static size_t findTopLevel(const std::string& s, char target) {
        int depth = 0;
        char quote = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (quote) {
                if (c == '\\' && quote == '"') {
                    ++i;
                } else if (c == quote) {
                    quote = 0;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '[' || c == '{') {
                ++depth;
            } else if (c == ']' || c == '}') {
                --depth;
            } else if (c == target && depth == 0) {
                return i;
            }
        }
        return std::string::npos;
    }

    static TomlValue parseValue(const std::string& raw) {
        TomlValue value;
        std::string v = trim(raw);
        if (v.empty()) {
            return value;
        }

        if (isTripleQuoted(v)) {
            std::string delimiter = v.substr(0, 3);
            size_t end = v.find(delimiter, 3);
            std::string body = v.substr(3, end == std::string::npos ? std::string::npos : end - 3);
            if (!body.empty() && body[0] == '\n') {
                body.erase(body.begin());
            }
            value.kind = TomlValue::Kind::String;
            value.text = body;
        } else if (v[0] == '"' || v[0] == '\'') {
            size_t pos = 0;
            value.kind = TomlValue::Kind::String;
            value.text = parseQuoted(v, pos);
        } else if (v[0] == '[') {
            value.kind = TomlValue::Kind::Array;
            int depth = 0;
            for (size_t i = 0; i < v.size(); ++i) {
                char c = v[i];
                if (c == '"' || c == '\'') {
                    std::string item = parseQuoted(v, i);
                    --i;
                    if (depth == 1) {
                        value.items.push_back(item);
                    }
                } else if (c == '[' || c == '{') {
                    ++depth;
                } else if (c == ']' || c == '}') {
                    --depth;
                }
            }
        } else if (v[0] == '{') {
            value.kind = TomlValue::Kind::Table;
            size_t close = v.rfind('}');
            std::string body = v.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            while (!trim(body).empty()) {
                size_t comma = findTopLevel(body, ',');
                std::string pair = body.substr(0, comma);
                size_t eq = findTopLevel(pair, '=');
                if (eq != std::string::npos) {
                    TomlValue field = parseValue(pair.substr(eq + 1));
                    if (field.kind == TomlValue::Kind::String) {
                        value.fields.push_back({stripQuotes(pair.substr(0, eq)), field.text});
                    }
                }
                if (comma == std::string::npos) {
                    break;
                }
                body = body.substr(comma + 1);
            }
        } else {
            value.text = v;
        }
        return value;
    }

    void parse(const std::string& text) {
        std::istringstream stream(text);
        std::string line;
        std::string current;
        std::string pending_key;
        std::string pending_value;

        while (std::getline(stream, line)) {
            if (!pending_key.empty()) {
                pending_value += "\n" + (isTripleQuoted(pending_value) ? line : stripComment(line));
                if (isComplete(pending_value)) {
                    ensureSection(current).push_back({pending_key, parseValue(pending_value)});
                    pending_key.clear();
                    pending_value.clear();
                }
                continue;
            }

            std::string stripped = trim(stripComment(line));
            if (stripped.empty()) {
                continue;
            }

            if (stripped[0] == '[') {
                std::string name = stripped;
                while (!name.empty() && name.front() == '[') {
                    name.erase(name.begin());
                }
                while (!name.empty() && name.back() == ']') {
                    name.pop_back();
                }
                current = trim(name);
                ensureSection(current);
                continue;
            }

            size_t eq = findTopLevel(stripped, '=');
            if (eq == std::string::npos) {
                continue;
            }
            std::string key = stripQuotes(stripped.substr(0, eq));
            std::string value = trim(stripped.substr(eq + 1));

            if (!isComplete(value)) {
                pending_key = key;
                pending_value = value;
                continue;
            }
            ensureSection(current).push_back({key, parseValue(value)});
        }
    }
};

std::string tomlVersionOf(const TomlValue& value) {
    if (value.kind == TomlValue::Kind::String) {
        return value.text;
    }
    if (value.kind == TomlValue::Kind::Table) {
        for (const auto& field : value.fields) {
            if (field.first == "version") {
                return field.second;
            }
        }
    }
    return "*";
}

std::string removeXmlBlocks(std::string text, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    size_t start = text.find(open);
    while (start != std::string::npos) {
        size_t end = text.find(close, start);
        if (end == std::string::npos) {
            break;
        }
        text.erase(start, end + close.size() - start);
        start = text.find(open, start);
    }
    return text;
}

void dedupe(std::vector<std::string>& values) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    for (const auto& value : values) {
        if (!value.empty() && seen.insert(value).second) {
            unique.push_back(value);
        }
    }
    values.swap(unique);
}

} // namespace

ProjectMetadata MetadataExtractor::extract(const std::string& root_path, const std::string& project_type) {
    fs::path root = fs::path(root_path).lexically_normal();
    if (!root.has_filename() && root.has_parent_path()) {
        root = root.parent_path();
    }

    ProjectMetadata meta;
    meta.name = root.filename().string();
    if (meta.name.empty()) {
        meta.name = "project";
    }
    meta.project_type = project_type;

    if (project_type == "Node.js" || project_type == "Next.js" ||
        project_type == "Vite" || project_type == "Nuxt.js") {
        extractPackageJson(root, meta);
    } else if (project_type == "Python") {
        extractPython(root, meta);
    } else if (project_type == "Rust") {
        extractCargoToml(root, meta);
    } else if (project_type == "Go") {
        extractGoMod(root, meta);
    } else if (project_type == "Flutter / Dart") {
        extractPubspec(root, meta);
    } else if (project_type == "Java / Maven") {
        extractPomXml(root, meta);
    } else if (project_type == "Android / Gradle" || project_type == "Gradle") {
        extractGradle(root, meta);
    }

    finalize(meta);
    return meta;
}

std::string MetadataExtractor::extractXmlTag(const std::string& text, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    size_t start = text.find(open);
    if (start == std::string::npos) {
        return "";
    }
    size_t after = start + open.size();
    size_t end = text.find(close, after);
    if (end == std::string::npos) {
        return "";
    }
    return trim(text.substr(after, end - after));
}

std::string MetadataExtractor::requirementName(const std::string& requirement) {
    size_t cut = requirement.find_first_of("><=~!;[");
    return trim(requirement.substr(0, cut));
}

void MetadataExtractor::extractPackageJson(const fs::path& root, ProjectMetadata& meta) {
    std::string content;
    if (!readText(root / "package.json", content)) {
        return;
    }

    // ordered_json keeps declaration order for dependency maps
    nlohmann::ordered_json pkg = nlohmann::ordered_json::parse(content, nullptr, false);
    if (pkg.is_discarded() || !pkg.is_object()) {
        LOG_WARNING("MetadataExtractor", "Malformed package.json", root.string());
        return;
    }

    auto stringField = [&pkg](const char* key) -> std::string {
        auto it = pkg.find(key);
        return (it != pkg.end() && it->is_string()) ? it->get<std::string>() : "";
    };

    std::string name = stringField("name");
    if (!name.empty()) {
        meta.name = name;
    }
    meta.version = stringField("version");
    meta.description = stringField("description");
    meta.entry_point = stringField("main");

    auto engines = pkg.find("engines");
    if (engines != pkg.end() && engines->is_object()) {
        for (auto it = engines->begin(); it != engines->end(); ++it) {
            if (it.value().is_string()) {
                meta.runtime.push_back(it.key() + " " + it.value().get<std::string>());
            }
        }
    }

    auto deps = pkg.find("dependencies");
    if (deps != pkg.end() && deps->is_object()) {
        for (auto it = deps->begin(); it != deps->end(); ++it) {
            meta.dependencies.push_back(it.key());
            if (it.value().is_string()) {
                meta.requirements.push_back(it.key() + "@" + it.value().get<std::string>());
            }
        }
    }

    auto dev_deps = pkg.find("devDependencies");
    if (dev_deps != pkg.end() && dev_deps->is_object()) {
        for (auto it = dev_deps->begin(); it != dev_deps->end(); ++it) {
            meta.dev_dependencies.push_back(it.key());
        }
    }

    if (meta.runtime.empty()) {
        for (const char* rc : {".nvmrc", ".node-version"}) {
            std::string version;
            if (readText(root / rc, version) && !trim(version).empty()) {
                meta.runtime.push_back("node " + trim(version));
                break;
            }
        }
    }

    std::string ts_content;
    if (readText(root / "tsconfig.json", ts_content)) {
        // tsconfig commonly carries comments
        nlohmann::json ts = nlohmann::json::parse(ts_content, nullptr, false, true);
        if (!ts.is_discarded() && ts.is_object()) {
            auto options = ts.find("compilerOptions");
            if (options != ts.end() && options->is_object()) {
                auto target = options->find("target");
                if (target != options->end() && target->is_string()) {
                    meta.runtime.push_back("ts target: " + target->get<std::string>());
                }
            }
        }
    }
}

void MetadataExtractor::extractCargoToml(const fs::path& root, ProjectMetadata& meta) {
    std::string content;
    if (!readText(root / "Cargo.toml", content)) {
        return;
    }

    TomlReader toml(content);

    std::string name = toml.getString("package", "name");
    if (!name.empty()) {
        meta.name = name;
    }
    meta.version = toml.getString("package", "version");
    meta.description = toml.getString("package", "description");

    std::string edition = toml.getString("package", "edition");
    if (!edition.empty()) {
        meta.runtime.push_back("rust edition " + edition);
    }
    std::string msrv = toml.getString("package", "rust-version");
    if (!msrv.empty()) {
        meta.runtime.push_back("rust >=" + msrv);
    }

    if (const auto* deps = toml.section("dependencies")) {
        for (const auto& entry : *deps) {
            meta.dependencies.push_back(entry.key);
            meta.requirements.push_back(entry.key + "@" + tomlVersionOf(entry.value));
        }
    }
    if (const auto* dev_deps = toml.section("dev-dependencies")) {
        for (const auto& entry : *dev_deps) {
            meta.dev_dependencies.push_back(entry.key);
        }
    }

    // [dependencies.name] style tables
    for (const auto& section_name : toml.sectionNames()) {
        if (startsWith(section_name, "dependencies.")) {
            std::string dep = section_name.substr(std::string("dependencies.").size());
            std::string version = toml.getString(section_name, "version");
            meta.dependencies.push_back(dep);
            meta.requirements.push_back(dep + "@" + (version.empty() ? "*" : version));
        } else if (startsWith(section_name, "dev-dependencies.")) {
            meta.dev_dependencies.push_back(section_name.substr(std::string("dev-dependencies.").size()));
        }
    }
}

void MetadataExtractor::extractPython(const fs::path& root, ProjectMetadata& meta) {
    std::string content;
    if (readText(root / "pyproject.toml", content)) {
        TomlReader toml(content);

        std::string table = toml.section("project") ? "project" : "tool.poetry";
        std::string name = toml.getString(table, "name");
        if (!name.empty()) {
            meta.name = name;
        }
        meta.version = toml.getString(table, "version");
        meta.description = toml.getString(table, "description");

        std::string requires_python = toml.getString("project", "requires-python");
        if (!requires_python.empty()) {
            meta.runtime.push_back("python " + requires_python);
        }

        const TomlValue* deps = toml.find("project", "dependencies");
        if (deps && deps->kind == TomlValue::Kind::Array) {
            for (const auto& dep : deps->items) {
                meta.dependencies.push_back(requirementName(dep));
                meta.requirements.push_back(trim(dep));
            }
        }

        if (const auto* poetry_deps = toml.section("tool.poetry.dependencies")) {
            for (const auto& entry : *poetry_deps) {
                std::string version = tomlVersionOf(entry.value);
                if (entry.key == "python") {
                    meta.runtime.push_back("python " + version);
                    continue;
                }
                meta.dependencies.push_back(entry.key);
                meta.requirements.push_back(entry.key + (version == "*" ? "" : version));
            }
        }
    }

    std::string requirements;
    if (meta.dependencies.empty() && readText(root / "requirements.txt", requirements)) {
        std::istringstream stream(requirements);
        std::string line;
        while (std::getline(stream, line)) {
            std::string entry = trim(line);
            if (entry.empty() || entry[0] == '#' || entry[0] == '-') {
                continue;
            }
            meta.dependencies.push_back(requirementName(entry));
            meta.requirements.push_back(entry);
        }
    }

    std::string python_version;
    if (meta.runtime.empty() && readText(root / ".python-version", python_version) &&
        !trim(python_version).empty()) {
        meta.runtime.push_back("python " + trim(python_version));
    }

    for (const char* entry : {"main.py", "app.py", "manage.py", "run.py"}) {
        std::error_code ec;
        if (fs::exists(root / entry, ec)) {
            meta.entry_point = entry;
            break;
        }
    }
}

void MetadataExtractor::extractGoMod(const fs::path& root, ProjectMetadata& meta) {
    std::string content;
    if (readText(root / "go.mod", content)) {
        std::istringstream stream(content);
        std::string line;
        bool in_require = false;

        while (std::getline(stream, line)) {
            std::string trimmed = trim(line);

            if (startsWith(trimmed, "module ")) {
                meta.name = trim(trimmed.substr(7));
            } else if (startsWith(trimmed, "go ")) {
                std::string go_version = trim(trimmed.substr(3));
                meta.version = go_version;
                meta.runtime.push_back("go " + go_version);
            } else if (trimmed == "require (") {
                in_require = true;
            } else if (trimmed == ")") {
                in_require = false;
            } else if (in_require || startsWith(trimmed, "require ")) {
                std::string spec = in_require ? trimmed : trim(trimmed.substr(8));
                if (spec.empty() || startsWith(spec, "//")) {
                    continue;
                }
                std::istringstream parts(spec);
                std::string module_path;
                std::string version;
                parts >> module_path >> version;
                meta.dependencies.push_back(module_path);
                if (!version.empty()) {
                    meta.requirements.push_back(module_path + "@" + version);
                }
            }
        }
    }

    std::error_code ec;
    if (fs::exists(root / "main.go", ec)) {
        meta.entry_point = "main.go";
    }
}

void MetadataExtractor::extractPubspec(const fs::path& root, ProjectMetadata& meta) {
    std::string content;
    if (readText(root / "pubspec.yaml", content)) {
        try {
            const YAML::Node doc = YAML::Load(content);
            if (doc.IsMap()) {
                if (doc["name"] && doc["name"].IsScalar()) {
                    meta.name = doc["name"].as<std::string>();
                }
                if (doc["version"] && doc["version"].IsScalar()) {
                    meta.version = doc["version"].as<std::string>();
                }
                if (doc["description"] && doc["description"].IsScalar()) {
                    meta.description = trim(doc["description"].as<std::string>());
                }

                const YAML::Node environment = doc["environment"];
                if (environment && environment.IsMap()) {
                    for (YAML::const_iterator it = environment.begin(); it != environment.end(); ++it) {
                        if (it->second.IsScalar()) {
                            meta.runtime.push_back(it->first.as<std::string>() + " " + it->second.as<std::string>());
                        }
                    }
                }

                const YAML::Node deps = doc["dependencies"];
                if (deps && deps.IsMap()) {
                    for (YAML::const_iterator it = deps.begin(); it != deps.end(); ++it) {
                        std::string dep = it->first.as<std::string>();
                        if (dep == "sdk") {
                            continue;
                        }
                        meta.dependencies.push_back(dep);
                        if (it->second.IsScalar()) {
                            std::string version = it->second.as<std::string>();
                            if (!version.empty() && version != "^") {
                                meta.requirements.push_back(dep + "@" + version);
                            }
                        }
                    }
                }

                const YAML::Node dev_deps = doc["dev_dependencies"];
                if (dev_deps && dev_deps.IsMap()) {
                    for (YAML::const_iterator it = dev_deps.begin(); it != dev_deps.end(); ++it) {
                        meta.dev_dependencies.push_back(it->first.as<std::string>());
                    }
                }
            }
        } catch (const YAML::Exception& e) {
            LOG_WARNING("MetadataExtractor", "Malformed pubspec.yaml", e.what());
        }
    }

    std::error_code ec;
    if (fs::exists(root / "lib" / "main.dart", ec)) {
        meta.entry_point = "lib/main.dart";
    }
}

void MetadataExtractor::extractPomXml(const fs::path& root, ProjectMetadata& meta) {
    std::string content;
    if (!readText(root / "pom.xml", content)) {
        return;
    }

    // Project-level tags, without nested coordinates of parent and dependencies
    std::string top_level = content;
    for (const char* block : {"parent", "dependencyManagement", "dependencies", "build", "profiles"}) {
        top_level = removeXmlBlocks(top_level, block);
    }

    std::string artifact = extractXmlTag(top_level, "artifactId");
    if (!artifact.empty()) {
        meta.name = artifact;
    }
    meta.version = extractXmlTag(top_level, "version");
    meta.description = extractXmlTag(top_level, "description");

    std::string java_version = extractXmlTag(content, "java.version");
    if (java_version.empty()) {
        java_version = extractXmlTag(content, "maven.compiler.source");
    }
    if (!java_version.empty()) {
        meta.runtime.push_back("java " + java_version);
    }

    std::istringstream stream(content);
    std::string line;
    bool in_deps = false;
    std::string group;
    std::string artifact_id;
    std::string version;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.find("<dependencies>") != std::string::npos) {
            in_deps = true;
        }
        if (trimmed.find("</dependencies>") != std::string::npos) {
            in_deps = false;
        }
        if (!in_deps) {
            continue;
        }

        std::string value = extractXmlTag(trimmed, "groupId");
        if (!value.empty()) {
            group = value;
        }
        value = extractXmlTag(trimmed, "artifactId");
        if (!value.empty()) {
            artifact_id = value;
        }
        value = extractXmlTag(trimmed, "version");
        if (!value.empty()) {
            version = value;
        }

        if (trimmed.find("</dependency>") != std::string::npos) {
            if (!artifact_id.empty()) {
                meta.dependencies.push_back(artifact_id);
                meta.requirements.push_back(version.empty()
                    ? group + ":" + artifact_id
                    : group + ":" + artifact_id + ":" + version);
            }
            group.clear();
            artifact_id.clear();
            version.clear();
        }
    }
}

void MetadataExtractor::extractGradle(const fs::path& root, ProjectMetadata& meta) {
    for (const char* settings_file : {"settings.gradle.kts", "settings.gradle"}) {
        std::string content;
        if (!readText(root / settings_file, content)) {
            continue;
        }

        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            std::string trimmed = trim(line);
            if (!startsWith(trimmed, "rootProject.name")) {
                continue;
            }
            size_t eq = trimmed.find('=');
            if (eq != std::string::npos) {
                std::string name = stripQuotes(trimmed.substr(eq + 1));
                if (!name.empty()) {
                    meta.name = name;
                }
            }
        }
        break;
    }
}

void MetadataExtractor::finalize(ProjectMetadata& meta) {
    dedupe(meta.dependencies);
    dedupe(meta.dev_dependencies);
    dedupe(meta.runtime);
    dedupe(meta.requirements);
    if (meta.requirements.size() > MAX_REQUIREMENTS) {
        meta.requirements.resize(MAX_REQUIREMENTS);
    }
}

} // namespace CodePack
