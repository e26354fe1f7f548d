#include "exec/dry_run.hpp"

namespace cmdtrust::exec {

const std::vector<std::pair<std::string, std::string>>& dry_run_mappings() {
    static const std::vector<std::pair<std::string, std::string>> mappings = {
        {"pytest", "--collect-only"},
        {"ruff", "--no-fix"},
        {"black", "--check"},
        {"prettier", "--check"},
        {"eslint", "--no-fix"},
        {"npm test", "-- --listTests"},
        {"make", "-n"},
        {"cargo", "--dry-run"}};
    return mappings;
}

std::string add_dry_run_flags(const std::string& command) {
    for (const auto& [tool, flag] : dry_run_mappings()) {
        if (command.find(tool) == std::string::npos) {
            continue;
        }
        if (command.find(flag) != std::string::npos) {
            continue;
        }

        const std::string separator = " -- ";
        const auto sep_pos = command.find(separator);
        if (sep_pos != std::string::npos) {
            std::string rewritten = command;
            rewritten.replace(sep_pos, separator.size(), " " + flag + separator);
            return rewritten;
        }
        return command + " " + flag;
    }
    return command;
}

}  // namespace cmdtrust::exec
