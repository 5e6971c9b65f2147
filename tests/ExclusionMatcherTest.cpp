// =================================================================
// tests/ExclusionMatcherTest.cpp
// =================================================================
// Unit tests for ExclusionMatcher component.

#include "CodePack/ExclusionMatcher.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;

class ExclusionMatcherTest {
public:
    void testBuiltinDirectories() {
        std::cout << "Testing built-in directory exclusions..." << std::endl;

        CodePack::ExclusionMatcher matcher;

        assert(matcher.isExcluded("node_modules", true) && "node_modules should be excluded");
        assert(matcher.isExcluded(".git", true));
        assert(matcher.isExcluded("__pycache__", true));
        assert(matcher.isExcluded("Node_Modules", true) && "Matching should ignore case");

        // Built-ins only apply to directories
        assert(!matcher.isExcluded("build", false) && "A file named build is kept");
        assert(!matcher.isExcluded("src", true));
        assert(!matcher.isExcluded("", true));

        std::cout << "✓ Built-in directory exclusions test passed" << std::endl;
    }

    void testUserRules() {
        std::cout << "Testing user rules..." << std::endl;

        CodePack::ExclusionMatcher matcher;
        size_t builtins = matcher.size();

        assert(matcher.addRule("*.log"));
        assert(matcher.addRule("fixtures/"));
        assert(matcher.addRule("secrets.txt"));
        assert(!matcher.addRule("# comment"));
        assert(!matcher.addRule("   "));
        assert(!matcher.addRule("src/generated") && "Multi-segment rules are rejected");
        assert(!matcher.addRule("!keep.log") && "Negations are skipped");
        assert(matcher.size() == builtins + 3);

        assert(matcher.isExcluded("debug.LOG", false));
        assert(matcher.isExcluded("fixtures", true));
        assert(!matcher.isExcluded("fixtures", false) && "Directory-only rule must not hit files");
        assert(matcher.isExcluded("secrets.txt", false));
        assert(!matcher.isExcluded("main.cpp", false));

        // Adding the same rule twice keeps one copy
        matcher.addRule("*.log");
        assert(matcher.size() == builtins + 3);

        std::cout << "✓ User rules test passed" << std::endl;
    }

    void testPluginRules() {
        std::cout << "Testing plugin directory rules..." << std::endl;

        CodePack::ExclusionMatcher matcher;
        matcher.addDirectoryRules({"Library", "Temp/", "", "obj*"});

        assert(matcher.isExcluded("Library", true));
        assert(matcher.isExcluded("temp", true));
        assert(matcher.isExcluded("objects", true));
        assert(!matcher.isExcluded("Library", false));

        std::cout << "✓ Plugin directory rules test passed" << std::endl;
    }

    void testGlobMatch() {
        std::cout << "Testing glob matching..." << std::endl;

        using CodePack::ExclusionMatcher;
        assert(ExclusionMatcher::globMatch("*.min.js", "app.min.js"));
        assert(!ExclusionMatcher::globMatch("*.min.js", "app.js"));
        assert(ExclusionMatcher::globMatch("file?.txt", "file1.txt"));
        assert(!ExclusionMatcher::globMatch("file?.txt", "file10.txt"));
        assert(ExclusionMatcher::globMatch("*", "anything"));
        assert(ExclusionMatcher::globMatch("a*b*c", "aXXbYYc"));
        assert(!ExclusionMatcher::globMatch("a*b*c", "aXXbYY"));

        std::cout << "✓ Glob matching test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing ignore file loading..." << std::endl;

        const std::string ignore_file = "test_exclusion_matcher.ignore";
        {
            std::ofstream out(ignore_file);
            out << "# generated output\n";
            out << "*.tmp\n";
            out << "\n";
            out << "cache/\n";
        }

        CodePack::ExclusionMatcher matcher;
        assert(matcher.loadFromFile(ignore_file) == 2);
        assert(matcher.isExcluded("x.tmp", false));
        assert(matcher.isExcluded("cache", true));
        assert(matcher.loadFromFile("does_not_exist.ignore") == 0);

        fs::remove(ignore_file);
        std::cout << "✓ Ignore file loading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ExclusionMatcher unit tests..." << std::endl;

        testBuiltinDirectories();
        testUserRules();
        testPluginRules();
        testGlobMatch();
        testLoadFromFile();

        std::cout << "All ExclusionMatcher tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        ExclusionMatcherTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
