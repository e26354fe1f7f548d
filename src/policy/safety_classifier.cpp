#include "policy/safety_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"

namespace cmdtrust::policy {

using core::errors::ErrorCategory;
using core::errors::TrustError;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

}  // namespace

SafetyClassifier::SafetyClassifier(SafetyPolicy policy)
    : max_command_chars_(policy.max_command_chars) {
    compiled_.reserve(policy.patterns.size());
    for (auto& pattern : policy.patterns) {
        CompiledPattern compiled;
        try {
            compiled.regex = std::regex(pattern.regex, std::regex::ECMAScript |
                                                           std::regex::icase);
        } catch (const std::regex_error& e) {
            // An unparsable pattern still blocks its literal text.
            LOG_ERROR("SafetyClassifier: invalid pattern '" + pattern.regex +
                      "' (" + e.what() + "), matching literally");
            compiled.literal_fallback = true;
        }
        compiled.source = std::move(pattern);
        compiled_.push_back(std::move(compiled));
    }
}

bool SafetyClassifier::too_long(const std::string& command) const {
    return max_command_chars_ > 0 && command.size() > max_command_chars_;
}

bool SafetyClassifier::is_dangerous(const std::string& command) const {
    if (too_long(command)) {
        LOG_WARN("Command of " + std::to_string(command.size()) +
                 " characters exceeds the " + std::to_string(max_command_chars_) +
                 " character limit");
        return true;
    }
    const std::string lowered = lowercase(command);
    for (const auto& pattern : compiled_) {
        bool hit = false;
        if (pattern.literal_fallback) {
            hit = lowered.find(lowercase(pattern.source.regex)) != std::string::npos;
        } else {
            hit = std::regex_search(command, pattern.regex);
        }
        if (hit) {
            LOG_WARN("Dangerous pattern detected in command: " +
                     pattern.source.regex + " (" + pattern.source.description + ")");
            return true;
        }
    }
    return false;
}

core::errors::Result<std::string> SafetyClassifier::classify(
    const std::string& command) const {
    if (command.empty()) {
        return TrustError{ErrorCategory::Input, "Command cannot be empty.",
                          "empty_command"};
    }
    if (too_long(command)) {
        return TrustError{ErrorCategory::Safety,
                          "Command is longer than " + std::to_string(max_command_chars_) +
                              " characters",
                          "command_too_long",
                          "Wrap long command lines in a script and teach the script."};
    }
    if (is_dangerous(command)) {
        return TrustError{ErrorCategory::Safety,
                          "Command contains dangerous patterns",
                          "dangerous_command"};
    }
    return command;
}

}  // namespace cmdtrust::policy
