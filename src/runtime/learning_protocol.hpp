#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/trust_config.hpp"
#include "detection/project_detector.hpp"
#include "exec/process_runner.hpp"
#include "exec/sandboxed_executor.hpp"
#include "ledger/trust_ledger.hpp"
#include "policy/safety_classifier.hpp"
#include "protocol/learning_contract.hpp"
#include "runtime/command_provider.hpp"
#include "runtime/command_verifier.hpp"

namespace cmdtrust::runtime {

// Question/answer loop between the tool and whoever teaches it commands.
// All durable state lives in the ledger; the protocol itself holds none.
class LearningProtocol {
public:
    LearningProtocol(std::filesystem::path project_root,
                     ledger::TrustLedger& ledger,
                     const exec::ProcessRunner& runner,
                     const detection::ProjectDetector& detector,
                     core::config::TrustConfig config = {});

    protocol::AskResponse ask_command(const protocol::AskRequest& request);
    protocol::TeachResponse teach_command(const protocol::TeachRequest& request);
    protocol::RunResponse run_command(const protocol::RunRequest& request);
    protocol::ProjectResponse learn_project();
    protocol::MemoryStatus get_memory_status() const;
    protocol::ClearResponse clear_command(const protocol::ClearRequest& request);

    // Teaches the provider's proposals one after another until one is
    // learned. Ends with need_answer once the provider has nothing left.
    protocol::TeachResponse bootstrap_command(const std::string& intent,
                                              const CommandProvider& provider);

private:
    void record_rejection(const std::string& command, const std::string& source,
                          const std::string& reason);
    void record_run(const std::string& intent_type, bool success,
                    std::optional<std::int64_t> duration_ms);
    std::string tail(const std::string& text) const;

    std::filesystem::path project_root_;
    ledger::TrustLedger& ledger_;
    const exec::ProcessRunner& runner_;
    const detection::ProjectDetector& detector_;
    core::config::TrustConfig config_;
    policy::SafetyClassifier classifier_;
    exec::SandboxedExecutor executor_;
    CommandVerifier verifier_;
};

}  // namespace cmdtrust::runtime
