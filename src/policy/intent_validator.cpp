#include "policy/intent_validator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace cmdtrust::policy {

using protocol::VerificationResult;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool is_word_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

VerificationResult invalid(std::string reason) {
    VerificationResult result;
    result.safe = true;
    result.valid = false;
    result.reason = std::move(reason);
    return result;
}

}  // namespace

bool IntentValidator::contains_word(const std::string& haystack,
                                    const std::string& word) {
    if (word.empty()) {
        return false;
    }
    std::size_t pos = haystack.find(word);
    while (pos != std::string::npos) {
        const std::size_t end = pos + word.size();
        const bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
        const bool right_ok = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = haystack.find(word, pos + 1);
    }
    return false;
}

VerificationResult IntentValidator::validate(const std::string& command,
                                             const std::string& intent) const {
    return validate(command, rules_for(intent));
}

VerificationResult IntentValidator::validate(const std::string& command,
                                             const IntentRules& rules) const {
    const std::string lowered = lowercase(command);

    if (!rules.must_contain.empty()) {
        const bool related = std::any_of(
            rules.must_contain.begin(), rules.must_contain.end(),
            [&lowered](const std::string& keyword) {
                return lowered.find(keyword) != std::string::npos;
            });
        if (!related) {
            std::string joined;
            for (const auto& keyword : rules.must_contain) {
                if (!joined.empty()) {
                    joined += " or ";
                }
                joined += keyword;
            }
            return invalid("Command doesn't appear to be a " + joined + " command");
        }
    }

    for (const auto& forbidden : rules.must_not_contain) {
        if (contains_word(lowered, lowercase(forbidden))) {
            return invalid("Command contains forbidden keyword: " + forbidden);
        }
    }

    VerificationResult result;
    result.safe = true;
    result.valid = true;
    return result;
}

}  // namespace cmdtrust::policy
