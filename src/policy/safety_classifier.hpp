#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>
#include "core/errors/trust_errors.hpp"

namespace cmdtrust::policy {

struct DangerousPattern {
    std::string regex;
    std::string description;
};

struct SafetyPolicy {
    std::vector<DangerousPattern> patterns = {
        {R"(rm\s+-rf\s+/)", "recursive force delete from root"},
        {R"(rm\s+-rf\s+~)", "recursive force delete of home"},
        {R"(>\s*/dev/sd)", "raw write to block device"},
        {R"(dd\s+if=.*of=/dev/)", "direct disk write"},
        {R"(chmod\s+-R\s+777\s+/)", "recursive permission change from root"},
        {R"(curl.*\|\s*sh)", "download piped into shell"},
        {R"(wget.*\|\s*bash)", "download piped into shell"},
        {R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "fork bomb"},
        {R"(mkfs\.)", "filesystem format"},
        {R"(rm\s+-rf\s+\*)", "recursive delete of working directory"},
        {R"(>\s*/etc/)", "write into system configuration"}};

    // Longer commands are refused unseen. std::regex recurses per character
    // and overflows the stack on very long input.
    std::size_t max_command_chars = 8192;
};

// Static, non-bypassable classifier for catastrophic shell commands.
class SafetyClassifier {
public:
    explicit SafetyClassifier(SafetyPolicy policy = {});

    // True when any pattern matches. Patterns are tried in order and the
    // first hit wins. Commands over the length limit count as dangerous.
    bool is_dangerous(const std::string& command) const;

    core::errors::Result<std::string> classify(const std::string& command) const;

private:
    struct CompiledPattern {
        DangerousPattern source;
        std::regex regex;
        bool literal_fallback = false;
    };

    bool too_long(const std::string& command) const;

    std::vector<CompiledPattern> compiled_;
    std::size_t max_command_chars_;
};

}  // namespace cmdtrust::policy
