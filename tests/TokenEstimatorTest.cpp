// =================================================================
// tests/TokenEstimatorTest.cpp
// =================================================================
// Unit tests for TokenEstimator component.

#include "CodePack/TokenEstimator.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <stdexcept>

namespace fs = std::filesystem;
using CodePack::TokenEstimator;

class TokenEstimatorTest {
private:
    std::string test_dir;

public:
    TokenEstimatorTest() : test_dir("test_token_estimator") {}

    ~TokenEstimatorTest() {
        fs::remove_all(test_dir);
    }

    void testEstimateFiles() {
        std::cout << "Testing selection estimate..." << std::endl;

        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        std::ofstream(test_dir + "/a.txt") << std::string(10, 'a');
        std::ofstream(test_dir + "/b.txt") << std::string(7, 'b');

        CodePack::TokenEstimate estimate = TokenEstimator::estimate({test_dir + "/a.txt", test_dir + "/b.txt"});
        assert(estimate.total_bytes == 17);
        assert(estimate.tokens == 5 && "17 bytes round up to 5 tokens");

        // Files that vanished count as zero bytes
        estimate = TokenEstimator::estimate({test_dir + "/a.txt", test_dir + "/missing.txt"});
        assert(estimate.total_bytes == 10);
        assert(estimate.tokens == 3);

        std::cout << "✓ Selection estimate test passed" << std::endl;
    }

    void testEmptySelectionRejected() {
        std::cout << "Testing empty selection..." << std::endl;

        bool threw = false;
        try {
            TokenEstimator::estimate({});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Empty selection test passed" << std::endl;
    }

    void testMonotonicInBytes() {
        std::cout << "Testing estimate monotonicity..." << std::endl;

        assert(TokenEstimator::estimateTokens(0) == 0);
        assert(TokenEstimator::estimateTokens(1) == 1);
        assert(TokenEstimator::estimateTokens(4) == 1);
        assert(TokenEstimator::estimateTokens(5) == 2);

        size_t previous = 0;
        for (size_t bytes = 0; bytes < 200; ++bytes) {
            size_t tokens = TokenEstimator::estimateTokens(bytes);
            assert(tokens >= previous);
            assert((tokens == 0) == (bytes == 0));
            previous = tokens;
        }

        std::cout << "✓ Estimate monotonicity test passed" << std::endl;
    }

    void testFormattingAndWarnings() {
        std::cout << "Testing formatting and warnings..." << std::endl;

        assert(TokenEstimator::formatTokens(999) == "999");
        assert(TokenEstimator::formatTokens(1500) == "1.5K");
        assert(TokenEstimator::formatTokens(2500000) == "2.5M");

        assert(TokenEstimator::warningFor(32000) == CodePack::TokenWarning::None);
        assert(TokenEstimator::warningFor(32001) == CodePack::TokenWarning::Large);
        assert(TokenEstimator::warningFor(128001) == CodePack::TokenWarning::ExceedsContext);
        assert(TokenEstimator::warningMessage(CodePack::TokenWarning::None).empty());
        assert(!TokenEstimator::warningMessage(CodePack::TokenWarning::Large).empty());

        std::cout << "✓ Formatting and warnings test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TokenEstimator unit tests..." << std::endl;

        testEstimateFiles();
        testEmptySelectionRejected();
        testMonotonicInBytes();
        testFormattingAndWarnings();

        std::cout << "All TokenEstimator tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        TokenEstimatorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
