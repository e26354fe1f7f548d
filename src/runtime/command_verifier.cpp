#include "runtime/command_verifier.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "policy/intent_rules.hpp"

namespace cmdtrust::runtime {

using core::errors::ErrorCategory;
using protocol::VerificationResult;

CommandVerifier::CommandVerifier(std::filesystem::path project_root,
                                 const policy::SafetyClassifier& classifier,
                                 const exec::SandboxedExecutor& executor)
    : project_root_(std::move(project_root)),
      classifier_(classifier),
      executor_(executor) {}

VerificationResult CommandVerifier::verify(const std::string& intent,
                                           const std::string& command) const {
    auto classified = classifier_.classify(command);
    if (core::errors::is_error(classified)) {
        const auto& err = core::errors::get_error(classified);
        VerificationResult result;
        result.safe = err.category != ErrorCategory::Safety;
        result.valid = false;
        result.reason = err.message;
        return result;
    }

    const auto& rules = policy::rules_for(intent);
    auto validated = validator_.validate(command, rules);
    if (!validated.valid) {
        LOG_INFO("CommandVerifier: " + policy::intent_key(intent) + " command '" +
                 command + "' failed validation: " + validated.reason.value_or(""));
        return validated;
    }

    auto executed = executor_.execute_for_verification(command, rules, project_root_);
    if (!executed.valid) {
        LOG_INFO("CommandVerifier: " + policy::intent_key(intent) + " command '" +
                 command + "' failed verification: " + executed.reason.value_or(""));
    }
    return executed;
}

std::map<std::string, VerificationResult> CommandVerifier::verify_batch(
    const std::map<std::string, std::string>& commands) const {
    std::map<std::string, VerificationResult> results;
    for (const auto& [intent, command] : commands) {
        LOG_INFO("Verifying " + intent + ": " + command);
        results[intent] = verify(intent, command);
    }
    return results;
}

}  // namespace cmdtrust::runtime
