// =================================================================
// tests/SysInteractionTest.cpp
// =================================================================
// Unit tests for SysInteraction file helpers and content sniffing.

#include "CodePack/SysInteraction.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <cassert>
#include <stdexcept>

namespace fs = std::filesystem;
using CodePack::SysInteraction;

class SysInteractionTest {
private:
    std::string test_dir;

public:
    SysInteractionTest() : test_dir("test_sys_interaction") {}

    ~SysInteractionTest() {
        fs::remove_all(test_dir);
    }

    void testUtf8Validation() {
        std::cout << "Testing UTF-8 validation..." << std::endl;

        assert(SysInteraction::isValidUtf8(""));
        assert(SysInteraction::isValidUtf8("plain ascii\n"));
        assert(SysInteraction::isValidUtf8("caf\xC3\xA9"));
        assert(SysInteraction::isValidUtf8("\xE2\x82\xAC 5"));
        assert(SysInteraction::isValidUtf8("\xF0\x9F\x98\x80"));

        assert(!SysInteraction::isValidUtf8("caf\xE9") && "Latin-1 bytes are not UTF-8");
        assert(!SysInteraction::isValidUtf8("end\xC3") && "Truncated sequence");
        assert(!SysInteraction::isValidUtf8("\xC0\xAF") && "Overlong encoding");
        assert(!SysInteraction::isValidUtf8("\xED\xA0\x80") && "Surrogate half");
        assert(!SysInteraction::isValidUtf8("\xF4\x90\x80\x80") && "Beyond U+10FFFF");
        assert(!SysInteraction::isValidUtf8("\x80") && "Stray continuation byte");

        assert(SysInteraction::isBinaryContent(std::string("ab\0cd", 5)));
        assert(SysInteraction::isBinaryContent("\xFF\xFE"));
        assert(!SysInteraction::isBinaryContent("caf\xC3\xA9\n"));

        std::cout << "✓ UTF-8 validation test passed" << std::endl;
    }

    void testAtomicWriteAndRead() {
        std::cout << "Testing atomic write and read..." << std::endl;

        fs::remove_all(test_dir);
        SysInteraction sys;
        const std::string path = test_dir + "/nested/out.txt";

        assert(sys.writeFileAtomic(path, "first"));
        assert(sys.fileExists(path));
        assert(sys.readFile(path) == "first");

        assert(sys.writeFileAtomic(path, std::string("second\0tail", 11)));
        assert(sys.readFile(path).size() == 11 && "Content is written byte for byte");

        size_t entries = 0;
        for (const auto& entry : fs::directory_iterator(test_dir + "/nested")) {
            (void)entry;
            ++entries;
        }
        assert(entries == 1 && "No temporary file is left behind");

        bool threw = false;
        try {
            sys.readFile(test_dir + "/missing.txt");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Atomic write and read test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running SysInteraction unit tests..." << std::endl;

        testUtf8Validation();
        testAtomicWriteAndRead();

        std::cout << "All SysInteraction tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        SysInteractionTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
