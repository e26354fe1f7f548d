#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/trust_config.hpp"
#include "core/errors/trust_errors.hpp"
#include "ledger/audit_log.hpp"
#include "protocol/command_records.hpp"

namespace cmdtrust::ledger {

// s / (s + f), halved while s is below the evidence minimum, capped below 1.
double compute_confidence(int success_count, int failure_count,
                          const core::config::TrustConfig& config = {});

// Durable per-project record of learned and rejected commands.
//
// Every mutating call persists the whole document. All but set_project_info
// also append one audit line. A persistence failure leaves the in-memory change in place and is
// reported as a Storage error. Intended for one writing process per project
// root; calls within a process are serialised.
class TrustLedger {
public:
    explicit TrustLedger(std::filesystem::path project_root,
                         core::config::TrustConfig config = {});

    // Trust gate: the command only if verified and confidence >= threshold.
    std::optional<std::string> get_command(const std::string& intent_type);

    // Creates or overwrites an entry: unverified, zero counters.
    core::errors::Result<protocol::CommandEntry> learn_command(
        const std::string& intent_type, const std::string& command,
        const std::string& source);

    // Returns false when no entry exists for the intent (nothing changes).
    core::errors::Result<bool> update_result(
        const std::string& intent_type, bool success,
        std::optional<std::int64_t> duration_ms = std::nullopt);

    core::errors::Result<bool> mark_verified(
        const std::string& intent_type, const std::string& method,
        const std::map<std::string, std::int64_t>& details = {});

    // Returns the buffer size after eviction.
    core::errors::Result<std::size_t> reject(const std::string& command,
                                             const std::string& source,
                                             const std::string& reason);

    core::errors::Result<bool> clear(const std::string& intent_type);

    core::errors::Result<bool> set_project_info(
        const std::map<std::string, std::string>& facts);

    // Verified entries above the introspection threshold.
    std::map<std::string, std::string> known_commands() const;
    std::optional<protocol::CommandEntry> entry(const std::string& intent_type) const;
    std::deque<protocol::RejectedCommand> rejected_commands() const;
    std::map<std::string, std::string> project_info() const;
    // Opaque block carried through load and save unchanged.
    nlohmann::json environment() const;

    std::string project_id() const;
    const std::filesystem::path& ledger_path() const { return ledger_path_; }
    const std::filesystem::path& audit_path() const { return audit_log_.path(); }

private:
    void load_locked();
    void reset_locked();
    core::errors::Result<bool> persist_locked(const std::string& updated_by);
    void audit_locked(const std::string& event, const nlohmann::json& fields);

    core::config::TrustConfig config_;
    std::filesystem::path ledger_path_;
    AuditLog audit_log_;

    mutable std::mutex mutex_;
    std::string version_;
    std::string project_id_;
    std::string created_;
    std::string last_updated_;
    std::string last_updated_by_;
    std::map<std::string, std::string> detected_;
    std::map<std::string, protocol::CommandEntry> commands_;
    std::deque<protocol::RejectedCommand> rejected_;
    nlohmann::json environment_ = nlohmann::json::object();
};

}  // namespace cmdtrust::ledger
