// =================================================================
// tests/StatsCalculatorTest.cpp
// =================================================================
// Unit tests for StatsCalculator component.

#include "CodePack/StatsCalculator.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;
using CodePack::StatsCalculator;

class StatsCalculatorTest {
private:
    std::string test_dir;

public:
    StatsCalculatorTest() : test_dir("test_stats_calculator") {}

    ~StatsCalculatorTest() {
        fs::remove_all(test_dir);
    }

    void testCountLines() {
        std::cout << "Testing line counting..." << std::endl;

        assert(StatsCalculator::countLines("") == 0);
        assert(StatsCalculator::countLines("one") == 1);
        assert(StatsCalculator::countLines("one\n") == 1 && "A trailing newline adds no line");
        assert(StatsCalculator::countLines("one\ntwo") == 2);
        assert(StatsCalculator::countLines("\n\n") == 2);

        std::cout << "✓ Line counting test passed" << std::endl;
    }

    void testPerLanguageStats() {
        std::cout << "Testing per-language aggregation..." << std::endl;

        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        std::ofstream(test_dir + "/a.rs") << "fn a() {}\nfn b() {}\n";
        std::ofstream(test_dir + "/b.RS") << "fn c() {}\n";
        std::ofstream(test_dir + "/c.tsx") << "1\n2\n3\n4\n";
        std::ofstream(test_dir + "/d.ts") << "x";
        std::ofstream(test_dir + "/Makefile") << "all:\n";
        {
            std::ofstream binary(test_dir + "/e.rs", std::ios::binary);
            binary << std::string("\0\1\2", 3);
        }

        CodePack::ProjectStats stats = StatsCalculator::computeStats({
            test_dir + "/a.rs", test_dir + "/b.RS", test_dir + "/c.tsx", test_dir + "/d.ts",
            test_dir + "/Makefile", test_dir + "/e.rs", test_dir + "/missing.rs"});

        assert(stats.total_files == 5 && "Binary and unreadable files are left out");
        assert(stats.total_lines == 9);
        assert(stats.languages.size() == 3);

        assert(stats.languages[0].language == "TypeScript");
        assert(stats.languages[0].file_count == 2);
        assert(stats.languages[0].line_count == 5);
        assert(stats.languages[1].language == "Rust");
        assert(stats.languages[1].line_count == 3);
        assert(stats.languages[1].byte_count == 30);
        assert(stats.languages[2].language == "other");

        std::cout << "✓ Per-language aggregation test passed" << std::endl;
    }

    void testLanguageNames() {
        std::cout << "Testing language names..." << std::endl;

        assert(StatsCalculator::extensionToLanguage("cpp") == "C++");
        assert(StatsCalculator::extensionToLanguage("yml") == "YAML");
        assert(StatsCalculator::extensionToLanguage("zig") == "zig");

        CodePack::ProjectStats empty = StatsCalculator::computeStats({});
        assert(empty.total_files == 0 && empty.languages.empty());

        std::cout << "✓ Language names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running StatsCalculator unit tests..." << std::endl;

        testCountLines();
        testPerLanguageStats();
        testLanguageNames();

        std::cout << "All StatsCalculator tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        StatsCalculatorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
