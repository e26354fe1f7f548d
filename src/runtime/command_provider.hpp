#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cmdtrust::runtime {

struct CommandProposal {
    std::string command;
    std::string source;
};

// Common candidates for an intent in a given language, most likely first.
// Empty for intents or languages without a table entry.
std::vector<std::string> suggestions_for(const std::string& intent,
                                         const std::string& language);

// Source of candidate commands for an intent. `tried` holds commands that
// were already proposed and must not be offered again.
class CommandProvider {
public:
    virtual ~CommandProvider() = default;

    virtual std::optional<CommandProposal> propose(
        const std::string& intent, const std::vector<std::string>& tried) const = 0;
};

class HeuristicProvider : public CommandProvider {
public:
    explicit HeuristicProvider(std::string language);

    std::optional<CommandProposal> propose(
        const std::string& intent, const std::vector<std::string>& tried) const override;

private:
    std::string language_;
};

// A single command supplied by an agent or a human.
class FixedCommandProvider : public CommandProvider {
public:
    FixedCommandProvider(std::string command, std::string source);

    std::optional<CommandProposal> propose(
        const std::string& intent, const std::vector<std::string>& tried) const override;

private:
    std::string command_;
    std::string source_;
};

}  // namespace cmdtrust::runtime
