// =================================================================
// tests/ConfigStoreTest.cpp
// =================================================================
// Unit tests for the persisted project store and the settings layer.

#include "CodePack/ConfigStore.hpp"
#include "CodePack/ConfigParser.hpp"
#include "CodePack/AppSettings.hpp"
#include "CodePack/CliParser.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <stdexcept>

namespace fs = std::filesystem;
using CodePack::ConfigStore;

class ConfigStoreTest {
private:
    std::string test_dir;

    std::string storePath() const { return test_dir + "/store/projects.json"; }

public:
    ConfigStoreTest() : test_dir("test_config_store") {}

    ~ConfigStoreTest() {
        fs::remove_all(test_dir);
    }

    void testMissingAndMalformedFiles() {
        std::cout << "Testing missing and malformed store files..." << std::endl;

        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        ConfigStore missing(storePath());
        assert(missing.load() && "A missing store is an empty store");
        assert(missing.recentProjects().empty());

        std::ofstream(test_dir + "/broken.json") << "{ not json";
        ConfigStore broken(test_dir + "/broken.json");
        assert(!broken.load());
        assert(broken.recentProjects().empty());

        std::ofstream(test_dir + "/wrong.json") << "[1, 2, 3]";
        ConfigStore wrong(test_dir + "/wrong.json");
        assert(!wrong.load());

        std::cout << "✓ Missing and malformed store files test passed" << std::endl;
    }

    void testSelectionPersistence() {
        std::cout << "Testing selection persistence..." << std::endl;

        fs::remove_all(test_dir);
        {
            ConfigStore store(storePath());
            assert(store.load());
            assert(store.saveSelection("/p", {"/p/a.rs", "/p/b.rs"}));
            assert(fs::exists(storePath()) && "Saving creates the parent directory");
        }

        ConfigStore reloaded(storePath());
        assert(reloaded.load());
        CodePack::ProjectConfig config;
        assert(reloaded.loadProject("/p", config));
        assert(config.project_path == "/p");
        assert(config.checked_paths.size() == 2);
        assert(config.checked_paths[1] == "/p/b.rs");
        assert(!config.last_opened.empty());
        assert(!reloaded.loadProject("/other", config));

        std::cout << "✓ Selection persistence test passed" << std::endl;
    }

    void testPresets() {
        std::cout << "Testing presets..." << std::endl;

        fs::remove_all(test_dir);
        ConfigStore store(storePath());
        assert(store.load());
        assert(store.savePreset("/p", "review", {"/p/a.rs"}));
        assert(store.savePreset("/p", "docs", {"/p/README.md", "/p/CHANGELOG.md"}));
        assert(store.savePreset("/p", "review", {"/p/b.rs"}) && "Saving again overwrites");

        std::vector<std::string> names = store.listPresets("/p");
        assert(names.size() == 2);
        assert(names[0] == "docs" && names[1] == "review");
        assert(store.listPresets("/unknown").empty());

        std::vector<std::string> paths;
        assert(store.getPreset("/p", "review", paths));
        assert(paths.size() == 1 && paths[0] == "/p/b.rs");
        assert(!store.getPreset("/p", "missing", paths));

        assert(store.deletePreset("/p", "docs"));
        assert(!store.deletePreset("/p", "docs"));
        assert(store.listPresets("/p").size() == 1);

        bool threw = false;
        try {
            store.savePreset("/p", "", {"/p/a.rs"});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        ConfigStore reloaded(storePath());
        assert(reloaded.load());
        assert(reloaded.getPreset("/p", "review", paths));
        assert(paths[0] == "/p/b.rs");

        std::cout << "✓ Presets test passed" << std::endl;
    }

    void testRecentProjectsOrder() {
        std::cout << "Testing recent project ordering..." << std::endl;

        ConfigStore store(test_dir + "/recent.json");
        std::string error;
        assert(store.deserialize(R"({
            "projects": {
                "/old":    {"last_opened": "100"},
                "/new":    {"last_opened": "300"},
                "/pinned": {"last_opened": "50", "pinned": true},
                "/middle": {"last_opened": "200", "checked_paths": ["/middle/x", 7]}
            }
        })", error));

        std::vector<CodePack::ProjectConfig> recent = store.recentProjects();
        assert(recent.size() == 4);
        assert(recent[0].project_path == "/pinned" && "Pinned projects come first");
        assert(recent[1].project_path == "/new");
        assert(recent[2].project_path == "/middle");
        assert(recent[3].project_path == "/old");
        assert(recent[2].checked_paths.size() == 1 && "Non-string entries are dropped");

        assert(store.setPinned("/old", true));
        assert(store.recentProjects()[0].project_path == "/old");

        assert(store.setExcludedPaths("/new", {"/new/generated"}));
        ConfigStore reloaded(test_dir + "/recent.json");
        assert(reloaded.load());
        CodePack::ProjectConfig config;
        assert(reloaded.loadProject("/new", config));
        assert(config.excluded_paths.size() == 1 && config.excluded_paths[0] == "/new/generated");

        assert(!store.deserialize(R"({"other": {}})", error));
        assert(!error.empty());

        std::cout << "✓ Recent project ordering test passed" << std::endl;
    }

    void testYamlSettings() {
        std::cout << "Testing YAML settings..." << std::endl;

        fs::create_directories(test_dir);
        std::ofstream(test_dir + "/config.yml")
            << "pack:\n"
            << "  max_file_bytes: 2048\n"
            << "  format: markdown\n"
            << "  mask_secrets: yes\n"
            << "scan:\n"
            << "  include_hidden: maybe\n"
            << "  exclude:\n"
            << "    - '*.lock'\n"
            << "    - 'dist/'\n"
            << "log:\n"
            << "  level: debug\n";

        CodePack::ConfigParser parser(test_dir + "/config.yml");
        assert(parser.isLoaded());
        assert(parser.getStringValue("pack.format") == "markdown");
        assert(parser.hasKey("scan.exclude"));
        assert(parser.getStringList("scan.exclude").size() == 2);
        assert(!parser.hasKey("paths.config_file"));
        assert(parser.getStringValue("paths.config_file").empty());

        CodePack::AppSettings settings;
        settings.loadFromConfig(parser);
        assert(settings.pack_max_file_bytes == 2048);
        assert(settings.pack_format == "markdown");
        assert(settings.pack_mask_secrets);
        assert(!settings.scan_include_hidden && "Unparseable values keep the default");
        assert(settings.scan_exclude.size() == 2 && settings.scan_exclude[1] == "dist/");
        assert(settings.log_level == "debug");
        assert(settings.config_file == ".codepack/projects.json");
        assert(settings.exportFormat() == CodePack::ExportFormat::Markdown);

        CodePack::ConfigParser missing(test_dir + "/absent.yml");
        assert(!missing.isLoaded());

        std::ofstream(test_dir + "/bad.yml") << "pack: [unclosed\n";
        CodePack::ConfigParser bad(test_dir + "/bad.yml");
        assert(!bad.isLoaded());
        assert(!bad.hasKey("pack"));

        std::cout << "✓ YAML settings test passed" << std::endl;
    }

    void testOverridesAndValidation() {
        std::cout << "Testing overrides and validation..." << std::endl;

        CodePack::AppSettings settings;
        std::string error;
        assert(settings.validate(error));

        CodePack::Commands commands;
        commands.format = "xml";
        commands.max_file_bytes = 10;
        commands.quiet = true;
        settings.applyCommandOverrides(commands);
        assert(settings.pack_format == "xml");
        assert(settings.pack_max_file_bytes == 10);
        assert(settings.log_level == "error");
        assert(settings.validate(error));

        CodePack::AppSettings zero;
        zero.pack_max_file_bytes = 0;
        assert(!zero.validate(error));
        assert(error.find("max_file_bytes") != std::string::npos);

        CodePack::AppSettings format;
        format.pack_format = "html";
        assert(!format.validate(error));

        CodePack::AppSettings level;
        level.log_level = "loud";
        assert(!level.validate(error));

        assert(CodePack::AppSettings::defaultConfigYaml().find("max_file_bytes: 1048576") != std::string::npos);

        std::cout << "✓ Overrides and validation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigStore unit tests..." << std::endl;

        testMissingAndMalformedFiles();
        testSelectionPersistence();
        testPresets();
        testRecentProjectsOrder();
        testYamlSettings();
        testOverridesAndValidation();

        std::cout << "All ConfigStore tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        ConfigStoreTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
