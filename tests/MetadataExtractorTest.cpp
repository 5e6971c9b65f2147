// =================================================================
// tests/MetadataExtractorTest.cpp
// =================================================================
// Unit tests for MetadataExtractor component.

#include "CodePack/MetadataExtractor.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <algorithm>

namespace fs = std::filesystem;

static bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

class MetadataExtractorTest {
private:
    std::string test_dir;

    void resetDir() {
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void write(const std::string& name, const std::string& content) {
        fs::path path = fs::path(test_dir) / name;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream(path) << content;
    }

public:
    MetadataExtractorTest() : test_dir("test_metadata_extractor") {}

    ~MetadataExtractorTest() {
        fs::remove_all(test_dir);
    }

    void testPackageJson() {
        std::cout << "Testing package.json extraction..." << std::endl;

        resetDir();
        write("package.json", R"({
  "name": "web-app",
  "version": "2.1.0",
  "description": "A demo",
  "main": "index.js",
  "engines": {"node": ">=18"},
  "dependencies": {"react": "^18.2.0", "axios": "1.6.0"},
  "devDependencies": {"typescript": "^5.0.0"}
})");
        write("tsconfig.json", "{\n  // comment\n  \"compilerOptions\": {\"target\": \"ES2022\"}\n}\n");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Node.js");
        assert(meta.name == "web-app");
        assert(meta.version == "2.1.0");
        assert(meta.description == "A demo");
        assert(meta.entry_point == "index.js");
        assert(meta.project_type == "Node.js");
        assert(meta.dependencies.size() == 2);
        assert(meta.dependencies[0] == "react" && "Declaration order is kept");
        assert(meta.dev_dependencies[0] == "typescript");
        assert(contains(meta.requirements, "react@^18.2.0"));
        assert(contains(meta.runtime, "node >=18"));
        assert(contains(meta.runtime, "ts target: ES2022"));

        std::cout << "✓ package.json extraction test passed" << std::endl;
    }

    void testMalformedManifest() {
        std::cout << "Testing malformed manifest..." << std::endl;

        resetDir();
        write("package.json", "{ \"name\": ");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Node.js");
        assert(meta.name == "test_metadata_extractor" && "Name falls back to the directory name");
        assert(meta.version.empty());
        assert(meta.dependencies.empty());

        std::cout << "✓ Malformed manifest test passed" << std::endl;
    }

    void testCargoToml() {
        std::cout << "Testing Cargo.toml extraction..." << std::endl;

        resetDir();
        write("Cargo.toml", R"([package]
name = "fast-tool"
version = "0.3.1"
edition = "2021"
description = """
Does things quickly"""

[dependencies]
serde = { version = "1.0", features = ["derive"] }
anyhow = "1"
tokio = { git = "https://example.com/tokio" }

[dependencies.clap]
version = "4.4"

[dev-dependencies]
tempfile = "3"
)");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Rust");
        assert(meta.name == "fast-tool");
        assert(meta.version == "0.3.1");
        assert(meta.description == "Does things quickly");
        assert(contains(meta.runtime, "rust edition 2021"));
        assert(meta.dependencies.size() == 4);
        assert(contains(meta.requirements, "serde@1.0"));
        assert(contains(meta.requirements, "anyhow@1"));
        assert(contains(meta.requirements, "tokio@*"));
        assert(contains(meta.requirements, "clap@4.4"));
        assert(meta.dev_dependencies.size() == 1 && meta.dev_dependencies[0] == "tempfile");

        std::cout << "✓ Cargo.toml extraction test passed" << std::endl;
    }

    void testPython() {
        std::cout << "Testing Python extraction..." << std::endl;

        resetDir();
        write("pyproject.toml", R"([project]
name = "analyzer"
version = "1.2.0"
requires-python = ">=3.10"
dependencies = [
    "flask>=2.0",
    "requests",
]
)");
        write("main.py", "print('hi')\n");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Python");
        assert(meta.name == "analyzer");
        assert(meta.version == "1.2.0");
        assert(contains(meta.runtime, "python >=3.10"));
        assert(meta.dependencies.size() == 2);
        assert(meta.dependencies[0] == "flask");
        assert(contains(meta.requirements, "flask>=2.0"));
        assert(meta.entry_point == "main.py");

        // requirements.txt is read when pyproject has no dependencies
        resetDir();
        write("requirements.txt", "# pinned\nnumpy==1.26.0\n-r other.txt\npandas\n");
        meta = CodePack::MetadataExtractor::extract(test_dir, "Python");
        assert(meta.dependencies.size() == 2);
        assert(meta.dependencies[0] == "numpy");
        assert(contains(meta.requirements, "numpy==1.26.0"));

        std::cout << "✓ Python extraction test passed" << std::endl;
    }

    void testGoMod() {
        std::cout << "Testing go.mod extraction..." << std::endl;

        resetDir();
        write("go.mod", R"(module github.com/acme/service

go 1.22

require (
	github.com/gorilla/mux v1.8.1
	// indirect comment
	golang.org/x/sync v0.6.0
)

require github.com/stretchr/testify v1.9.0
)");
        write("main.go", "package main\n");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Go");
        assert(meta.name == "github.com/acme/service");
        assert(contains(meta.runtime, "go 1.22"));
        assert(meta.dependencies.size() == 3);
        assert(contains(meta.requirements, "github.com/gorilla/mux@v1.8.1"));
        assert(meta.entry_point == "main.go");

        std::cout << "✓ go.mod extraction test passed" << std::endl;
    }

    void testPubspec() {
        std::cout << "Testing pubspec.yaml extraction..." << std::endl;

        resetDir();
        write("pubspec.yaml", R"(name: mobile_app
description: A Flutter app
version: 1.0.0+1
environment:
  sdk: ">=3.0.0 <4.0.0"
dependencies:
  flutter:
    sdk: flutter
  http: ^1.1.0
dev_dependencies:
  flutter_test:
    sdk: flutter
)");
        write("lib/main.dart", "void main() {}\n");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Flutter / Dart");
        assert(meta.name == "mobile_app");
        assert(meta.version == "1.0.0+1");
        assert(contains(meta.runtime, "sdk >=3.0.0 <4.0.0"));
        assert(contains(meta.dependencies, "flutter"));
        assert(contains(meta.requirements, "http@^1.1.0"));
        assert(meta.dev_dependencies.size() == 1);
        assert(meta.entry_point == "lib/main.dart");

        std::cout << "✓ pubspec.yaml extraction test passed" << std::endl;
    }

    void testPomXml() {
        std::cout << "Testing pom.xml extraction..." << std::endl;

        resetDir();
        write("pom.xml", R"(<project>
  <parent>
    <groupId>org.springframework.boot</groupId>
    <artifactId>spring-boot-starter-parent</artifactId>
    <version>3.2.0</version>
  </parent>
  <artifactId>orders</artifactId>
  <version>0.0.1</version>
  <properties>
    <java.version>17</java.version>
  </properties>
  <dependencies>
    <dependency>
      <groupId>org.postgresql</groupId>
      <artifactId>postgresql</artifactId>
      <version>42.7.1</version>
    </dependency>
    <dependency>
      <groupId>org.springframework.boot</groupId>
      <artifactId>spring-boot-starter-web</artifactId>
    </dependency>
  </dependencies>
</project>
)");

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Java / Maven");
        assert(meta.name == "orders" && "Parent coordinates must not leak into the name");
        assert(meta.version == "0.0.1");
        assert(contains(meta.runtime, "java 17"));
        assert(meta.dependencies.size() == 2);
        assert(contains(meta.requirements, "org.postgresql:postgresql:42.7.1"));
        assert(contains(meta.requirements, "org.springframework.boot:spring-boot-starter-web"));

        std::cout << "✓ pom.xml extraction test passed" << std::endl;
    }

    void testGradleAndHelpers() {
        std::cout << "Testing Gradle name and helpers..." << std::endl;

        resetDir();
        write("settings.gradle.kts", "rootProject.name = \"droid\"\ninclude(\":app\")\n");
        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Android / Gradle");
        assert(meta.name == "droid");

        using CodePack::MetadataExtractor;
        assert(MetadataExtractor::requirementName("flask>=2.0") == "flask");
        assert(MetadataExtractor::requirementName("uvicorn[standard]") == "uvicorn");
        assert(MetadataExtractor::requirementName("plain") == "plain");
        assert(MetadataExtractor::extractXmlTag("<a> x </a>", "a") == "x");
        assert(MetadataExtractor::extractXmlTag("<a>x", "a").empty());

        std::cout << "✓ Gradle name and helpers test passed" << std::endl;
    }

    void testRequirementsCapAndDedupe() {
        std::cout << "Testing requirements cap..." << std::endl;

        resetDir();
        std::string requirements;
        for (int i = 0; i < 60; ++i) {
            requirements += "pkg" + std::to_string(i) + "\n";
        }
        requirements += "pkg0\n";
        write("requirements.txt", requirements);

        CodePack::ProjectMetadata meta = CodePack::MetadataExtractor::extract(test_dir, "Python");
        assert(meta.dependencies.size() == 60 && "Duplicates are removed");
        assert(meta.requirements.size() == CodePack::MetadataExtractor::MAX_REQUIREMENTS);

        std::cout << "✓ Requirements cap test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running MetadataExtractor unit tests..." << std::endl;

        testPackageJson();
        testMalformedManifest();
        testCargoToml();
        testPython();
        testGoMod();
        testPubspec();
        testPomXml();
        testGradleAndHelpers();
        testRequirementsCapAndDedupe();

        std::cout << "All MetadataExtractor tests passed!" << std::endl;
    }
};

int main() {
    CodePack::Logger::getInstance().setFileLogging(false);
    CodePack::Logger::getInstance().setConsoleLogging(false);

    try {
        MetadataExtractorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
