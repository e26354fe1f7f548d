#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace cmdtrust::detection {

// language, framework, package_manager, test_framework -> value.
// Absent keys mean "unknown".
using ProjectFacts = std::map<std::string, std::string>;

class ProjectDetector {
public:
    virtual ~ProjectDetector() = default;
    virtual ProjectFacts detect(const std::filesystem::path& project_root) const = 0;
};

// Looks for well-known manifest and lock files at the project root.
class MarkerFileDetector : public ProjectDetector {
public:
    ProjectFacts detect(const std::filesystem::path& project_root) const override;
};

}  // namespace cmdtrust::detection
