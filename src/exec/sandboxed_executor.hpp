#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/config/trust_config.hpp"
#include "exec/process_runner.hpp"
#include "policy/intent_rules.hpp"
#include "protocol/command_records.hpp"

namespace cmdtrust::exec {

// Dry-runs a candidate command and checks that it behaves like its intent:
// expected output, no unexpected file mutation, plausible duration.
// Callers must have cleared the command with the SafetyClassifier first.
class SandboxedExecutor {
public:
    explicit SandboxedExecutor(const ProcessRunner& runner,
                               core::config::TrustConfig config = {});

    protocol::VerificationResult execute_for_verification(
        const std::string& command, const policy::IntentRules& rules,
        const std::filesystem::path& project_root) const;

private:
    static bool output_matches(const std::string& output,
                               const std::vector<std::string>& patterns);

    const ProcessRunner& runner_;
    core::config::TrustConfig config_;
};

}  // namespace cmdtrust::exec
