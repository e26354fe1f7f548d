#include "exec/sandboxed_executor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <utility>
#include "core/logging/logger.hpp"
#include "exec/dry_run.hpp"
#include "exec/file_snapshot.hpp"

namespace cmdtrust::exec {

using protocol::VerificationResult;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

VerificationResult rejected(std::string reason) {
    VerificationResult result;
    result.safe = true;
    result.valid = false;
    result.reason = std::move(reason);
    return result;
}

}  // namespace

SandboxedExecutor::SandboxedExecutor(const ProcessRunner& runner,
                                     core::config::TrustConfig config)
    : runner_(runner), config_(std::move(config)) {}

bool SandboxedExecutor::output_matches(const std::string& output,
                                       const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        try {
            const std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
            if (std::regex_search(output, re)) {
                return true;
            }
        } catch (const std::regex_error& e) {
            LOG_WARN("SandboxedExecutor: invalid output pattern '" + pattern +
                     "' (" + e.what() + "), matching literally");
            if (lowercase(output).find(lowercase(pattern)) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

VerificationResult SandboxedExecutor::execute_for_verification(
    const std::string& command, const policy::IntentRules& rules,
    const std::filesystem::path& project_root) const {
    const FileSnapshot before = FileSnapshot::capture(project_root);

    const std::string dry_run_command = add_dry_run_flags(command);
    if (dry_run_command != command) {
        LOG_INFO("SandboxedExecutor: dry-run rewrite '" + command + "' -> '" +
                 dry_run_command + "'");
    }

    ProcessRequest request;
    request.command = dry_run_command;
    request.working_directory = project_root;
    request.timeout_ms = config_.verification_timeout_ms;

    auto run_result = runner_.run(request);
    if (core::errors::is_error(run_result)) {
        const auto& err = core::errors::get_error(run_result);
        LOG_WARN("SandboxedExecutor: execution error [" + err.code + "]: " + err.message);
        return rejected("Error during verification: " + err.message);
    }
    const auto& capture = core::errors::get_value(run_result);

    if (capture.timed_out) {
        return rejected("Command timed out during verification");
    }
    if (capture.cancelled) {
        return rejected("Error during verification: command cancelled");
    }

    const auto duration_ms = static_cast<std::int64_t>(capture.duration_ms);
    const std::string output = capture.stdout_text + capture.stderr_text;
    const std::string output_sample = output.substr(0, config_.output_sample_chars);

    if (!rules.expected_output_patterns.empty() &&
        !output_matches(output, rules.expected_output_patterns)) {
        auto result = rejected("Output doesn't match expected patterns");
        result.output_sample = output_sample;
        result.duration_ms = duration_ms;
        return result;
    }

    const FileSnapshot after = FileSnapshot::capture(project_root);
    const std::size_t files_modified = before.symmetric_difference(after);

    // Only unexpected mutation is a violation. A mutating intent that
    // changed nothing passes.
    if (!rules.modifies_files && files_modified > 0) {
        auto result = rejected("Command modified " + std::to_string(files_modified) +
                               " files when it shouldn't");
        result.files_modified = files_modified;
        result.duration_ms = duration_ms;
        return result;
    }

    if (duration_ms < rules.min_duration_ms) {
        auto result =
            rejected("Command completed too quickly, might not be doing real work");
        result.duration_ms = duration_ms;
        return result;
    }
    if (duration_ms > rules.max_duration_ms) {
        auto result = rejected("Command took too long, might be stuck");
        result.duration_ms = duration_ms;
        return result;
    }

    VerificationResult result;
    result.safe = true;
    result.valid = true;
    result.output_sample = output_sample;
    result.duration_ms = duration_ms;
    result.files_modified = files_modified;
    return result;
}

}  // namespace cmdtrust::exec
