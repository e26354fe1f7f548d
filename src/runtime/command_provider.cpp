#include "runtime/command_provider.hpp"

#include <algorithm>
#include <map>
#include <utility>
#include "policy/intent_rules.hpp"

namespace cmdtrust::runtime {

namespace {

using LanguageTable = std::map<std::string, std::vector<std::string>>;

const std::map<std::string, LanguageTable>& suggestion_table() {
    static const std::map<std::string, LanguageTable> table = {
        {"test",
         {{"python", {"pytest", "python -m pytest", "uv run pytest", "python -m unittest"}},
          {"javascript", {"npm test", "yarn test", "jest", "mocha"}},
          {"rust", {"cargo test"}},
          {"go", {"go test ./..."}},
          {"java", {"mvn test", "gradle test"}}}},
        {"lint",
         {{"python", {"ruff check .", "pylint", "flake8", "uv run ruff check ."}},
          {"javascript", {"eslint .", "npm run lint", "standard"}},
          {"rust", {"cargo clippy"}},
          {"go", {"golangci-lint run"}},
          {"java", {"mvn checkstyle:check"}}}},
        {"format",
         {{"python", {"black .", "ruff format .", "autopep8", "uv run black ."}},
          {"javascript", {"prettier --write .", "npm run format"}},
          {"rust", {"cargo fmt"}},
          {"go", {"go fmt ./...", "gofumpt -w ."}},
          {"java", {"mvn formatter:format"}}}},
    };
    return table;
}

bool was_tried(const std::string& command, const std::vector<std::string>& tried) {
    return std::find(tried.begin(), tried.end(), command) != tried.end();
}

}  // namespace

std::vector<std::string> suggestions_for(const std::string& intent,
                                         const std::string& language) {
    const auto& table = suggestion_table();
    const auto by_intent = table.find(policy::intent_key(intent));
    if (by_intent == table.end()) {
        return {};
    }
    const auto by_language = by_intent->second.find(language);
    if (by_language == by_intent->second.end()) {
        return {};
    }
    return by_language->second;
}

HeuristicProvider::HeuristicProvider(std::string language) : language_(std::move(language)) {}

std::optional<CommandProposal> HeuristicProvider::propose(
    const std::string& intent, const std::vector<std::string>& tried) const {
    for (const auto& candidate : suggestions_for(intent, language_)) {
        if (!was_tried(candidate, tried)) {
            return CommandProposal{candidate, "heuristic"};
        }
    }
    return std::nullopt;
}

FixedCommandProvider::FixedCommandProvider(std::string command, std::string source)
    : command_(std::move(command)), source_(std::move(source)) {}

std::optional<CommandProposal> FixedCommandProvider::propose(
    const std::string&, const std::vector<std::string>& tried) const {
    if (command_.empty() || was_tried(command_, tried)) {
        return std::nullopt;
    }
    return CommandProposal{command_, source_};
}

}  // namespace cmdtrust::runtime
