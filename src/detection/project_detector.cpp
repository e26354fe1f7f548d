#include "detection/project_detector.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace cmdtrust::detection {

namespace {

struct Marker {
    const char* file;
    const char* value;
};

bool exists_at(const std::filesystem::path& root, const char* name) {
    std::error_code ec;
    return std::filesystem::exists(root / name, ec) && !ec;
}

std::string first_present(const std::filesystem::path& root,
                          const std::vector<Marker>& markers) {
    for (const auto& marker : markers) {
        if (exists_at(root, marker.file)) {
            return marker.value;
        }
    }
    return "";
}

std::string read_small_file(const std::filesystem::path& path) {
    constexpr std::uintmax_t kMaxManifestBytes = 256 * 1024;
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size > kMaxManifestBytes) {
        return "";
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return "";
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Cheap substring sniffing of a manifest for framework names.
std::string framework_from_manifest(const std::string& manifest,
                                    const std::vector<Marker>& candidates) {
    for (const auto& candidate : candidates) {
        if (manifest.find(candidate.file) != std::string::npos) {
            return candidate.value;
        }
    }
    return "";
}

}  // namespace

ProjectFacts MarkerFileDetector::detect(const std::filesystem::path& project_root) const {
    ProjectFacts facts;

    const std::string language = first_present(
        project_root, {{"pyproject.toml", "python"},
                       {"setup.py", "python"},
                       {"requirements.txt", "python"},
                       {"package.json", "javascript"},
                       {"Cargo.toml", "rust"},
                       {"go.mod", "go"},
                       {"pom.xml", "java"},
                       {"build.gradle", "java"},
                       {"CMakeLists.txt", "cpp"}});
    if (language.empty()) {
        return facts;
    }
    facts["language"] = language;

    const std::string package_manager = first_present(
        project_root, {{"uv.lock", "uv"},
                       {"poetry.lock", "poetry"},
                       {"pnpm-lock.yaml", "pnpm"},
                       {"yarn.lock", "yarn"},
                       {"package-lock.json", "npm"},
                       {"Cargo.lock", "cargo"},
                       {"go.sum", "go"},
                       {"pom.xml", "maven"},
                       {"build.gradle", "gradle"}});
    if (!package_manager.empty()) {
        facts["package_manager"] = package_manager;
    } else if (language == "python") {
        facts["package_manager"] = "pip";
    } else if (language == "javascript") {
        facts["package_manager"] = "npm";
    }

    const std::string test_framework = first_present(
        project_root, {{"pytest.ini", "pytest"},
                       {"conftest.py", "pytest"},
                       {"jest.config.js", "jest"},
                       {"jest.config.ts", "jest"},
                       {".mocharc.json", "mocha"},
                       {"vitest.config.ts", "vitest"}});
    if (!test_framework.empty()) {
        facts["test_framework"] = test_framework;
    }

    if (language == "python") {
        const std::string manifest = read_small_file(project_root / "pyproject.toml") +
                                     read_small_file(project_root / "requirements.txt");
        const std::string framework = framework_from_manifest(
            manifest, {{"django", "django"}, {"fastapi", "fastapi"}, {"flask", "flask"}});
        if (!framework.empty()) {
            facts["framework"] = framework;
        }
        if (!facts.count("test_framework") && manifest.find("pytest") != std::string::npos) {
            facts["test_framework"] = "pytest";
        }
    } else if (language == "javascript") {
        const std::string manifest = read_small_file(project_root / "package.json");
        const std::string framework = framework_from_manifest(
            manifest, {{"\"next\"", "next"},
                       {"\"react\"", "react"},
                       {"\"vue\"", "vue"},
                       {"\"express\"", "express"}});
        if (!framework.empty()) {
            facts["framework"] = framework;
        }
        if (!facts.count("test_framework")) {
            const std::string runner = framework_from_manifest(
                manifest, {{"\"jest\"", "jest"}, {"\"vitest\"", "vitest"}, {"\"mocha\"", "mocha"}});
            if (!runner.empty()) {
                facts["test_framework"] = runner;
            }
        }
    }

    return facts;
}

}  // namespace cmdtrust::detection
