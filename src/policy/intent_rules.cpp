#include "policy/intent_rules.hpp"

#include <algorithm>
#include <cctype>

namespace cmdtrust::policy {

namespace {

constexpr const char* kTypeSuffix = "_cmd";

std::string lowercase_trimmed(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::map<std::string, IntentRules> build_table() {
    std::map<std::string, IntentRules> table;

    IntentRules test;
    test.must_contain = {"test", "spec", "check", "pytest", "jest", "mocha", "jasmine"};
    test.must_not_contain = {"rm", "delete", "format", "install"};
    test.min_duration_ms = 100;
    test.max_duration_ms = 300000;
    test.modifies_files = false;
    test.expected_output_patterns = {"test", "pass", "fail", "ok", "error"};
    table.emplace("test", test);

    IntentRules lint;
    lint.must_contain = {"lint", "check", "ruff", "flake", "eslint", "pylint", "rubocop"};
    lint.must_not_contain = {"rm", "delete", "install"};
    lint.min_duration_ms = 100;
    lint.max_duration_ms = 60000;
    lint.modifies_files = false;
    lint.expected_output_patterns = {"error", "warning", "found", "issue",
                                     "problem", "ok", "clean"};
    table.emplace("lint", lint);

    IntentRules format;
    format.must_contain = {"format", "black", "prettier", "fmt", "autopep", "standard"};
    format.must_not_contain = {"rm", "test", "install"};
    format.min_duration_ms = 100;
    format.max_duration_ms = 60000;
    format.modifies_files = true;
    format.expected_output_patterns = {"reformat", "fixed", "changed", "modified"};
    table.emplace("format", format);

    IntentRules coverage;
    coverage.must_contain = {"cov", "coverage", "cover"};
    coverage.must_not_contain = {"rm", "delete", "install"};
    coverage.min_duration_ms = 500;
    coverage.max_duration_ms = 600000;
    coverage.modifies_files = false;
    coverage.expected_output_patterns = {R"(\d+%)", "coverage", "lines", "statements"};
    table.emplace("coverage", coverage);

    IntentRules build;
    build.must_contain = {"build", "compile", "bundle", "webpack", "rollup", "tsc"};
    build.must_not_contain = {"rm -rf", "sudo"};
    build.min_duration_ms = 500;
    build.max_duration_ms = 600000;
    build.modifies_files = true;
    build.expected_output_patterns = {"built", "compiled", "bundle", "success", "complete"};
    table.emplace("build", build);

    return table;
}

}  // namespace

std::string intent_key(const std::string& intent) {
    std::string key = lowercase_trimmed(intent);
    const std::string suffix = kTypeSuffix;
    if (key.size() > suffix.size() &&
        key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
        key.erase(key.size() - suffix.size());
    }
    return key;
}

std::string intent_type(const std::string& intent) {
    std::string type = intent_key(intent);
    std::transform(type.begin(), type.end(), type.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return type + "_CMD";
}

const std::vector<std::string>& standard_intents() {
    static const std::vector<std::string> intents = {"test", "lint", "format",
                                                     "coverage", "build"};
    return intents;
}

const std::map<std::string, IntentRules>& intent_rule_table() {
    static const std::map<std::string, IntentRules> table = build_table();
    return table;
}

const IntentRules& default_rules() {
    static const IntentRules rules = [] {
        IntentRules r;
        r.must_not_contain = {"rm", "delete", "sudo"};
        r.min_duration_ms = 10;
        r.max_duration_ms = 600000;
        r.modifies_files = false;
        return r;
    }();
    return rules;
}

const IntentRules& rules_for(const std::string& intent) {
    const auto& table = intent_rule_table();
    const auto it = table.find(intent_key(intent));
    if (it == table.end()) {
        return default_rules();
    }
    return it->second;
}

bool has_rules(const std::string& intent) {
    return intent_rule_table().count(intent_key(intent)) > 0;
}

}  // namespace cmdtrust::policy
