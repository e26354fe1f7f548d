#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/trust_errors.hpp"

namespace cmdtrust::ledger {

// Append-only JSON-lines event log. Each line is one object with
// `timestamp`, `event` and the event's own keys. Never read back or
// truncated by this program.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path log_path);

    core::errors::Result<std::filesystem::path> append(
        const std::string& event, const nlohmann::json& fields = nlohmann::json::object()) const;

    const std::filesystem::path& path() const { return log_path_; }

private:
    std::filesystem::path log_path_;
};

}  // namespace cmdtrust::ledger
