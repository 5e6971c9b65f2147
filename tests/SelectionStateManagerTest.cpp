// =================================================================
// tests/SelectionStateManagerTest.cpp
// =================================================================
// Unit tests for SelectionStateManager component.

#include "CodePack/SelectionStateManager.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <stdexcept>

using CodePack::FileNode;
using CodePack::SelectionStateManager;

static FileNode makeFile(const std::string& parent, const std::string& name) {
    FileNode node;
    node.name = name;
    node.path = parent + "/" + name;
    return node;
}

static FileNode makeDir(const std::string& parent, const std::string& name) {
    FileNode node;
    node.name = name;
    node.path = parent + "/" + name;
    node.is_dir = true;
    return node;
}

// /p
//   src/
//     lib/
//       util.rs
//     main.rs
//   Cargo.toml
//   README.md
static FileNode buildTree() {
    FileNode root;
    root.name = "p";
    root.path = "/p";
    root.is_dir = true;

    FileNode src = makeDir("/p", "src");
    FileNode lib = makeDir("/p/src", "lib");
    lib.children.push_back(makeFile("/p/src/lib", "util.rs"));
    src.children.push_back(lib);
    src.children.push_back(makeFile("/p/src", "main.rs"));

    root.children.push_back(src);
    root.children.push_back(makeFile("/p", "Cargo.toml"));
    root.children.push_back(makeFile("/p", "README.md"));
    return root;
}

// Every directory agrees with its children
static bool triStateHolds(const FileNode& node) {
    if (!node.is_dir) {
        return !node.indeterminate;
    }
    bool all = !node.children.empty();
    bool any = false;
    for (const auto& child : node.children) {
        if (!triStateHolds(child)) {
            return false;
        }
        if (!child.checked || child.indeterminate) {
            all = false;
        }
        if (child.checked || child.indeterminate) {
            any = true;
        }
    }
    return node.checked == all && node.indeterminate == (any && !all);
}

static std::vector<std::string> sorted(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    return values;
}

class SelectionStateManagerTest {
public:
    void testSetAllAndUpdateParent() {
        std::cout << "Testing setAll and tri-state propagation..." << std::endl;

        FileNode tree = buildTree();
        SelectionStateManager::setAll(tree, true);
        SelectionStateManager::updateParent(tree);
        assert(tree.checked && !tree.indeterminate);
        assert(SelectionStateManager::collectChecked(tree).size() == 4);
        assert(triStateHolds(tree));

        SelectionStateManager::setAll(tree, false);
        assert(SelectionStateManager::collectChecked(tree).empty());
        assert(triStateHolds(tree));

        std::cout << "✓ setAll and tri-state propagation test passed" << std::endl;
    }

    void testToggleLeafAndDirectory() {
        std::cout << "Testing toggles..." << std::endl;

        FileNode tree = buildTree();
        assert(SelectionStateManager::setChecked(tree, "/p/src/main.rs", true));
        assert(tree.indeterminate && !tree.checked);
        const FileNode* src = SelectionStateManager::findNode(tree, "/p/src");
        assert(src != nullptr && src->indeterminate);
        assert(triStateHolds(tree));

        assert(SelectionStateManager::setChecked(tree, "/p/src", true));
        src = SelectionStateManager::findNode(tree, "/p/src");
        assert(src->checked && !src->indeterminate);
        assert(SelectionStateManager::findNode(tree, "/p/src/lib/util.rs")->checked);
        assert(triStateHolds(tree));

        assert(SelectionStateManager::setChecked(tree, "/p", true));
        assert(tree.checked && !tree.indeterminate);

        assert(!SelectionStateManager::setChecked(tree, "/p/missing.rs", true));
        assert(SelectionStateManager::findNode(tree, "/p/missing.rs") == nullptr);

        std::cout << "✓ Toggles test passed" << std::endl;
    }

    void testRestoreIntersectsWithTree() {
        std::cout << "Testing restore..." << std::endl;

        FileNode tree = buildTree();
        SelectionStateManager::restore(tree, std::vector<std::string>{
            "/p/src/lib/util.rs", "/p/README.md", "/p/gone.rs", "/p/src"});

        std::vector<std::string> checked = sorted(SelectionStateManager::collectChecked(tree));
        assert(checked.size() == 2 && "Unknown paths and directories are ignored");
        assert(checked[0] == "/p/README.md");
        assert(checked[1] == "/p/src/lib/util.rs");
        assert(triStateHolds(tree));

        const FileNode* lib = SelectionStateManager::findNode(tree, "/p/src/lib");
        assert(lib->checked && "A directory with all children checked is checked");

        std::cout << "✓ Restore test passed" << std::endl;
    }

    void testReconcileOnRescan() {
        std::cout << "Testing reconciliation after rescan..." << std::endl;

        FileNode old_tree = buildTree();
        SelectionStateManager::restore(old_tree, std::vector<std::string>{"/p/src/main.rs", "/p/README.md"});

        FileNode new_tree = buildTree();
        new_tree.children.erase(new_tree.children.begin() + 2); // README.md removed
        new_tree.children[0].children.push_back(makeFile("/p/src", "new.rs"));

        CodePack::ReconcileReport report = SelectionStateManager::reconcileOnRescan(old_tree, new_tree);
        assert(report.performed);
        assert(report.added == 1);
        assert(report.removed == 1);
        assert(report.checked == 1);

        std::vector<std::string> checked = SelectionStateManager::collectChecked(new_tree);
        assert(checked.size() == 1 && checked[0] == "/p/src/main.rs");
        assert(!SelectionStateManager::findNode(new_tree, "/p/src/new.rs")->checked && "New files start unchecked");
        assert(triStateHolds(new_tree));

        std::cout << "✓ Reconciliation after rescan test passed" << std::endl;
    }

    void testBulkActions() {
        std::cout << "Testing bulk actions..." << std::endl;

        FileNode tree = buildTree();

        SelectionStateManager::applyBulkAction(tree, CodePack::BulkAction::SelectExtension, ".RS");
        assert(SelectionStateManager::collectChecked(tree).size() == 2);
        assert(triStateHolds(tree));

        SelectionStateManager::applyBulkAction(tree, CodePack::BulkAction::SelectConfig);
        std::vector<std::string> config = SelectionStateManager::collectChecked(tree);
        assert(config.size() == 1 && config[0] == "/p/Cargo.toml");

        SelectionStateManager::applyBulkAction(tree, CodePack::BulkAction::SelectSource);
        assert(SelectionStateManager::collectChecked(tree).size() == 2);

        SelectionStateManager::applyBulkAction(tree, CodePack::BulkAction::SelectAll);
        assert(SelectionStateManager::collectChecked(tree).size() == 4);
        assert(tree.checked);

        SelectionStateManager::applyBulkAction(tree, CodePack::BulkAction::SelectNone);
        assert(SelectionStateManager::collectChecked(tree).empty());

        bool threw = false;
        try {
            SelectionStateManager::applyBulkAction(tree, CodePack::BulkAction::SelectExtension, "");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Extension filter needs an argument");

        std::cout << "✓ Bulk actions test passed" << std::endl;
    }

    void testGitChanged() {
        std::cout << "Testing Git-changed selection..." << std::endl;

        FileNode tree = buildTree();
        CodePack::GitStatus git;
        git.is_repo = true;
        git.changed_files.push_back({"/p/src/main.rs", "modified"});
        git.changed_files.push_back({"/p/README.md", "deleted"});
        git.changed_files.push_back({"/p/other/../Cargo.toml", "added"});

        SelectionStateManager::selectGitChanged(tree, git);
        std::vector<std::string> checked = sorted(SelectionStateManager::collectChecked(tree));
        assert(checked.size() == 2);
        assert(checked[0] == "/p/Cargo.toml" && "Paths are compared after normalization");
        assert(checked[1] == "/p/src/main.rs");

        std::cout << "✓ Git-changed selection test passed" << std::endl;
    }

    void testParseBulkAction() {
        std::cout << "Testing bulk action names..." << std::endl;

        CodePack::BulkAction action;
        assert(SelectionStateManager::parseBulkAction("ALL", action) && action == CodePack::BulkAction::SelectAll);
        assert(SelectionStateManager::parseBulkAction("ext", action) && action == CodePack::BulkAction::SelectExtension);
        assert(SelectionStateManager::parseBulkAction("git", action) && action == CodePack::BulkAction::SelectGitChanged);
        assert(!SelectionStateManager::parseBulkAction("everything", action));

        assert(SelectionStateManager::getSelectionExtension("Main.RS") == "rs");
        assert(SelectionStateManager::getSelectionExtension("Makefile") == "makefile");
        assert(SelectionStateManager::getSelectionExtension(".env") == "env");

        std::cout << "✓ Bulk action names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running SelectionStateManager unit tests..." << std::endl;

        testSetAllAndUpdateParent();
        testToggleLeafAndDirectory();
        testRestoreIntersectsWithTree();
        testReconcileOnRescan();
        testBulkActions();
        testGitChanged();
        testParseBulkAction();

        std::cout << "All SelectionStateManager tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        SelectionStateManagerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
