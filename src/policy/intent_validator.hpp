#pragma once

#include <string>
#include "policy/intent_rules.hpp"
#include "protocol/command_records.hpp"

namespace cmdtrust::policy {

// Keyword check of a command against the rules of its declared intent.
// Never executes anything. The returned result always has safe == true.
class IntentValidator {
public:
    protocol::VerificationResult validate(const std::string& command,
                                          const std::string& intent) const;

    protocol::VerificationResult validate(const std::string& command,
                                          const IntentRules& rules) const;

    static bool contains_word(const std::string& haystack, const std::string& word);
};

}  // namespace cmdtrust::policy
