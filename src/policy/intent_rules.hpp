#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cmdtrust::policy {

struct IntentRules {
    std::vector<std::string> must_contain;
    std::vector<std::string> must_not_contain;
    std::int64_t min_duration_ms = 0;
    std::int64_t max_duration_ms = 600000;
    bool modifies_files = false;
    std::vector<std::string> expected_output_patterns;
};

// Normalises "Lint", "lint" and "LINT_CMD" to the rule key "lint".
std::string intent_key(const std::string& intent);

// Normalises "lint" and "LINT_CMD" to the ledger key "LINT_CMD".
std::string intent_type(const std::string& intent);

// Intents the learning protocol asks for when bootstrapping a project.
const std::vector<std::string>& standard_intents();

// Static per-intent table. Unknown intents get default_rules().
const std::map<std::string, IntentRules>& intent_rule_table();
const IntentRules& default_rules();
const IntentRules& rules_for(const std::string& intent);
bool has_rules(const std::string& intent);

}  // namespace cmdtrust::policy
