#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "exec/sandboxed_executor.hpp"
#include "policy/intent_validator.hpp"
#include "policy/safety_classifier.hpp"
#include "protocol/command_records.hpp"

namespace cmdtrust::runtime {

// Safety classifier, then intent validator, then sandboxed dry run.
// Each stage runs only if the previous one passed.
class CommandVerifier {
public:
    CommandVerifier(std::filesystem::path project_root,
                    const policy::SafetyClassifier& classifier,
                    const exec::SandboxedExecutor& executor);

    protocol::VerificationResult verify(const std::string& intent,
                                        const std::string& command) const;

    // intent -> command in, intent -> result out. Runs one at a time so the
    // file snapshots of different commands cannot overlap.
    std::map<std::string, protocol::VerificationResult> verify_batch(
        const std::map<std::string, std::string>& commands) const;

private:
    std::filesystem::path project_root_;
    const policy::SafetyClassifier& classifier_;
    policy::IntentValidator validator_;
    const exec::SandboxedExecutor& executor_;
};

}  // namespace cmdtrust::runtime
