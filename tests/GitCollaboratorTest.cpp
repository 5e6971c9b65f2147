// =================================================================
// tests/GitCollaboratorTest.cpp
// =================================================================
// Unit tests for GitCollaborator output parsing.

#include "CodePack/GitCollaborator.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <cassert>

namespace fs = std::filesystem;
using CodePack::GitCollaborator;

class GitCollaboratorTest {
public:
    void testStatusLabels() {
        std::cout << "Testing status labels..." << std::endl;

        assert(GitCollaborator::statusLabel('?', '?') == "added");
        assert(GitCollaborator::statusLabel('A', ' ') == "added");
        assert(GitCollaborator::statusLabel(' ', 'M') == "modified");
        assert(GitCollaborator::statusLabel('M', 'M') == "modified");
        assert(GitCollaborator::statusLabel('D', ' ') == "deleted");
        assert(GitCollaborator::statusLabel('R', ' ') == "renamed");
        assert(GitCollaborator::statusLabel(' ', 'T') == "typechange");
        assert(GitCollaborator::statusLabel('U', 'U') == "unknown");

        std::cout << "✓ Status labels test passed" << std::endl;
    }

    void testParsePorcelain() {
        std::cout << "Testing porcelain parsing..." << std::endl;

        const std::string output =
            " M src/main.rs\n"
            "?? notes.txt\r\n"
            "R  old.rs -> src/new.rs\n"
            " D gone.py\n"
            "!! target/ignored.o\n"
            "?? \"with space.md\"\n"
            "x\n";

        auto files = GitCollaborator::parsePorcelain(output, "/repo");
        assert(files.size() == 5);
        assert(files[0].path == "/repo/src/main.rs" && files[0].status == "modified");
        assert(files[1].path == "/repo/notes.txt" && files[1].status == "added");
        assert(files[2].path == "/repo/src/new.rs" && "Renames report the new path");
        assert(files[2].status == "renamed");
        assert(files[3].status == "deleted");
        assert(files[4].path == "/repo/with space.md" && "Quoted paths are unquoted");

        assert(GitCollaborator::parsePorcelain("", "/repo").empty());

        std::cout << "✓ Porcelain parsing test passed" << std::endl;
    }

    void testSplitUnifiedDiff() {
        std::cout << "Testing unified diff splitting..." << std::endl;

        const std::string first =
            "diff --git a/src/main.rs b/src/main.rs\n"
            "index 1111111..2222222 100644\n"
            "--- a/src/main.rs\n"
            "+++ b/src/main.rs\n"
            "@@ -1 +1 @@\n"
            "-fn main() {}\n"
            "+fn main() { run(); }\n";
        const std::string second =
            "diff --git a/README.md b/README.md\n"
            "new file mode 100644\n"
            "--- /dev/null\n"
            "+++ b/README.md\n"
            "@@ -0,0 +1 @@\n"
            "+# Title";

        auto diffs = GitCollaborator::splitUnifiedDiff(first + second);
        assert(diffs.size() == 2);
        assert(diffs["src/main.rs"] == first);
        assert(diffs["README.md"] == second && "The last section keeps its unterminated line");

        assert(GitCollaborator::splitUnifiedDiff("").empty());
        assert(GitCollaborator::splitUnifiedDiff("not a diff\n").empty());

        std::cout << "✓ Unified diff splitting test passed" << std::endl;
    }

    void testNonRepository() {
        std::cout << "Testing a directory outside any repository..." << std::endl;

        fs::path dir = fs::temp_directory_path() / "codepack_git_collaborator_test";
        fs::remove_all(dir);
        fs::create_directories(dir);

        GitCollaborator git;
        CodePack::GitStatus status = git.status(dir.string());
        assert(!status.is_repo);
        assert(status.changed_files.empty());
        assert(git.diffs(dir.string()).empty());

        fs::remove_all(dir);

        std::cout << "✓ Non-repository test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running GitCollaborator unit tests..." << std::endl;

        testStatusLabels();
        testParsePorcelain();
        testSplitUnifiedDiff();
        testNonRepository();

        std::cout << "All GitCollaborator tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        GitCollaboratorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
