#include "runtime/learning_protocol.hpp"

#include <algorithm>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/intent_rules.hpp"

namespace cmdtrust::runtime {

using protocol::ResponseStatus;

namespace {

policy::SafetyPolicy safety_policy_for(const core::config::TrustConfig& config) {
    policy::SafetyPolicy policy;
    policy.max_command_chars = config.max_command_chars;
    return policy;
}

}  // namespace

LearningProtocol::LearningProtocol(std::filesystem::path project_root,
                                   ledger::TrustLedger& ledger,
                                   const exec::ProcessRunner& runner,
                                   const detection::ProjectDetector& detector,
                                   core::config::TrustConfig config)
    : project_root_(std::move(project_root)),
      ledger_(ledger),
      runner_(runner),
      detector_(detector),
      config_(std::move(config)),
      classifier_(safety_policy_for(config_)),
      executor_(runner_, config_),
      verifier_(project_root_, classifier_, executor_) {}

protocol::AskResponse LearningProtocol::ask_command(const protocol::AskRequest& request) {
    protocol::AskResponse response;
    const std::string type = policy::intent_type(request.intent);

    if (const auto existing = ledger_.get_command(type)) {
        response.status = ResponseStatus::AlreadyKnown;
        response.command = *existing;
        response.message = "I already know to use: " + *existing;
        return response;
    }

    const auto info = ledger_.project_info();
    const auto language = info.find("language");
    std::vector<std::string> suggestions = suggestions_for(
        request.intent, language == info.end() ? std::string() : language->second);
    suggestions.erase(std::remove_if(suggestions.begin(), suggestions.end(),
                                     [&request](const std::string& candidate) {
                                         return std::find(request.tried.begin(),
                                                          request.tried.end(),
                                                          candidate) != request.tried.end();
                                     }),
                      suggestions.end());

    response.status = ResponseStatus::NeedAnswer;
    response.question = request.question;
    response.context = request.context;
    response.suggestions = std::move(suggestions);
    response.message = "Please provide the command to use";
    return response;
}

protocol::TeachResponse LearningProtocol::teach_command(const protocol::TeachRequest& request) {
    protocol::TeachResponse response;
    response.command = request.command;

    if (request.intent.empty()) {
        response.status = ResponseStatus::Invalid;
        response.reason = "Intent is required";
        response.message = "Tell me which intent this command is for";
        return response;
    }

    const auto verification = verifier_.verify(request.intent, request.command);

    if (!verification.safe) {
        const std::string reason = verification.reason.value_or("Command is not safe");
        record_rejection(request.command, request.source, reason);
        response.status = ResponseStatus::Rejected;
        response.reason = reason;
        response.message = "Command rejected for safety reasons";
        return response;
    }

    if (!verification.valid) {
        const std::string reason = verification.reason.value_or("Command failed verification");
        record_rejection(request.command, request.source, reason);
        response.status = ResponseStatus::Invalid;
        response.reason = reason;
        response.output_sample = verification.output_sample;
        response.duration_ms = verification.duration_ms;
        response.message = "Command doesn't appear to work correctly";
        return response;
    }

    if (request.save) {
        const std::string type = policy::intent_type(request.intent);
        auto learned = ledger_.learn_command(type, request.command, request.source);
        if (core::errors::is_error(learned)) {
            const auto& err = core::errors::get_error(learned);
            LOG_ERROR("Failed to learn " + type + " [" + err.code + "]: " + err.message);
            response.status = ResponseStatus::Error;
            response.reason = err.message;
            response.message = "Command works but could not be saved";
            return response;
        }

        std::map<std::string, std::int64_t> details;
        if (verification.duration_ms) {
            details["duration_ms"] = *verification.duration_ms;
        }
        auto marked = ledger_.mark_verified(type, "agent_provided", details);
        if (core::errors::is_error(marked)) {
            const auto& err = core::errors::get_error(marked);
            LOG_ERROR("Failed to mark " + type + " verified [" + err.code + "]: " + err.message);
            response.status = ResponseStatus::Error;
            response.reason = err.message;
            response.message = "Command works but could not be saved";
            return response;
        }
    }

    response.status = ResponseStatus::Learned;
    response.verified = true;
    response.duration_ms = verification.duration_ms;
    response.message = "Thanks! I'll use '" + request.command + "' for " + request.intent;
    return response;
}

protocol::RunResponse LearningProtocol::run_command(const protocol::RunRequest& request) {
    protocol::RunResponse response;
    const std::string type = policy::intent_type(request.intent);

    const auto command = ledger_.get_command(type);
    if (!command) {
        response.status = ResponseStatus::UnknownCommand;
        response.message =
            "I don't know how to " + request.intent + " yet. Please teach me first.";
        return response;
    }
    response.command = *command;

    exec::ProcessRequest process;
    process.command = *command;
    process.working_directory = project_root_;
    process.timeout_ms = config_.trusted_run_timeout_ms;

    auto ran = runner_.run(process);
    if (core::errors::is_error(ran)) {
        const auto& err = core::errors::get_error(ran);
        LOG_ERROR("Trusted " + type + " command failed to start [" + err.code + "]: " +
                  err.message);
        record_run(type, false, std::nullopt);
        response.status = ResponseStatus::Error;
        response.error = err.message;
        response.message = "Command could not be started";
        return response;
    }

    const auto& capture = core::errors::get_value(ran);
    const auto duration_ms = static_cast<std::int64_t>(capture.duration_ms);
    response.duration_ms = duration_ms;
    response.stdout_tail = tail(capture.stdout_text);
    response.stderr_tail = tail(capture.stderr_text);

    if (capture.timed_out || capture.cancelled) {
        record_run(type, false, duration_ms);
        response.status = ResponseStatus::Timeout;
        response.message = "Command timed out after " +
                           std::to_string(config_.trusted_run_timeout_ms / 1000) + " seconds";
        return response;
    }

    const bool success = capture.exit_code == 0;
    record_run(type, success, duration_ms);
    response.status = success ? ResponseStatus::Success : ResponseStatus::Failure;
    response.exit_code = capture.exit_code;
    response.message = success ? "Command succeeded"
                               : "Command exited with code " + std::to_string(capture.exit_code);
    return response;
}

protocol::ProjectResponse LearningProtocol::learn_project() {
    protocol::ProjectResponse response;
    response.detected = detector_.detect(project_root_);

    auto recorded = ledger_.set_project_info(response.detected);
    if (core::errors::is_error(recorded)) {
        const auto& err = core::errors::get_error(recorded);
        LOG_WARN("Could not record project info [" + err.code + "]: " + err.message);
    }

    response.known_commands = ledger_.known_commands();
    for (const auto& intent : policy::standard_intents()) {
        if (response.known_commands.count(policy::intent_type(intent)) == 0) {
            response.questions[intent] = "What command should I use for " + intent + "?";
        }
    }

    if (response.questions.empty()) {
        response.status = ResponseStatus::AlreadyConfigured;
        response.message = "I already know all the commands for this project!";
    } else {
        response.status = ResponseStatus::NeedTeaching;
        response.message = "Please teach me these commands for your project";
    }
    return response;
}

protocol::MemoryStatus LearningProtocol::get_memory_status() const {
    protocol::MemoryStatus status;
    status.project_id = ledger_.project_id();
    status.project_info = ledger_.project_info();
    status.known_commands = ledger_.known_commands();
    status.learned_file = ledger_.ledger_path().string();
    status.rejected_count = ledger_.rejected_commands().size();
    status.message = "This is what I know about the project";
    return status;
}

protocol::ClearResponse LearningProtocol::clear_command(const protocol::ClearRequest& request) {
    protocol::ClearResponse response;
    response.intent_type = policy::intent_type(request.intent);

    auto cleared = ledger_.clear(response.intent_type);
    if (core::errors::is_error(cleared)) {
        const auto& err = core::errors::get_error(cleared);
        LOG_ERROR("Failed to clear " + response.intent_type + " [" + err.code + "]: " +
                  err.message);
        response.status = ResponseStatus::Error;
        response.message = err.message;
        return response;
    }

    if (core::errors::get_value(cleared)) {
        response.status = ResponseStatus::Cleared;
        response.message = "Forgot the command for " + request.intent;
    } else {
        response.status = ResponseStatus::UnknownCommand;
        response.message = "No command learned for " + request.intent;
    }
    return response;
}

protocol::TeachResponse LearningProtocol::bootstrap_command(const std::string& intent,
                                                            const CommandProvider& provider) {
    if (const auto existing = ledger_.get_command(policy::intent_type(intent))) {
        protocol::TeachResponse known;
        known.status = ResponseStatus::AlreadyKnown;
        known.command = *existing;
        known.verified = true;
        known.message = "I already know to use: " + *existing;
        return known;
    }

    std::vector<std::string> tried;
    std::optional<std::string> last_reason;
    while (const auto proposal = provider.propose(intent, tried)) {
        if (std::find(tried.begin(), tried.end(), proposal->command) != tried.end()) {
            break;
        }
        tried.push_back(proposal->command);

        protocol::TeachRequest request;
        request.intent = intent;
        request.command = proposal->command;
        request.source = proposal->source;
        auto response = teach_command(request);
        if (response.status == ResponseStatus::Learned ||
            response.status == ResponseStatus::Error) {
            return response;
        }
        LOG_INFO("Candidate '" + proposal->command + "' for " + intent + " was " +
                 protocol::to_string(response.status));
        last_reason = response.reason;
    }

    protocol::TeachResponse exhausted;
    exhausted.status = ResponseStatus::NeedAnswer;
    exhausted.reason = last_reason;
    exhausted.message = "Tried " + std::to_string(tried.size()) + " candidate(s) for " +
                        intent + "; please provide the command to use";
    return exhausted;
}

void LearningProtocol::record_rejection(const std::string& command, const std::string& source,
                                        const std::string& reason) {
    if (command.empty()) {
        return;
    }
    auto rejected = ledger_.reject(command, source, reason);
    if (core::errors::is_error(rejected)) {
        const auto& err = core::errors::get_error(rejected);
        LOG_WARN("Could not persist rejection [" + err.code + "]: " + err.message);
    }
}

void LearningProtocol::record_run(const std::string& intent_type, bool success,
                                  std::optional<std::int64_t> duration_ms) {
    auto updated = ledger_.update_result(intent_type, success, duration_ms);
    if (core::errors::is_error(updated)) {
        const auto& err = core::errors::get_error(updated);
        LOG_WARN("Could not persist result for " + intent_type + " [" + err.code + "]: " +
                 err.message);
    }
}

std::string LearningProtocol::tail(const std::string& text) const {
    if (text.size() <= config_.run_output_tail_chars) {
        return text;
    }
    return text.substr(text.size() - config_.run_output_tail_chars);
}

}  // namespace cmdtrust::runtime
