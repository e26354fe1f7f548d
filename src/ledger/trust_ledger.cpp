#include "ledger/trust_ledger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>
#include "core/config/project_id.hpp"
#include "core/logging/logger.hpp"
#include "core/time/timestamp.hpp"

namespace cmdtrust::ledger {

using core::errors::ErrorCategory;
using core::errors::TrustError;
using nlohmann::json;
using protocol::CommandEntry;
using protocol::RejectedCommand;
using protocol::VerificationInfo;

namespace {

json entry_to_json(const CommandEntry& entry) {
    json payload;
    payload["command"] = entry.command;
    payload["learned_at"] = entry.learned_at;
    payload["learned_from"] = entry.learned_from;
    payload["verified"] = entry.verified;
    payload["success_count"] = entry.success_count;
    payload["failure_count"] = entry.failure_count;
    payload["confidence"] = entry.confidence;
    if (entry.last_success.has_value()) {
        payload["last_success"] = entry.last_success.value();
    }
    if (entry.last_failure.has_value()) {
        payload["last_failure"] = entry.last_failure.value();
    }
    if (entry.typical_duration_ms.has_value()) {
        payload["typical_duration_ms"] = entry.typical_duration_ms.value();
    }
    if (entry.verification.has_value()) {
        json verification;
        verification["method"] = entry.verification->method;
        verification["verified_at"] = entry.verification->verified_at;
        for (const auto& [key, value] : entry.verification->details) {
            verification[key] = value;
        }
        payload["verification"] = verification;
    }
    return payload;
}

// Throws nlohmann::json exceptions on malformed input; the caller decides.
CommandEntry entry_from_json(const json& payload) {
    CommandEntry entry;
    entry.command = payload.at("command").get<std::string>();
    entry.learned_at = payload.value("learned_at", std::string());
    entry.learned_from = payload.value("learned_from", std::string("unknown"));
    entry.verified = payload.value("verified", false);
    entry.success_count = std::max(0, payload.value("success_count", 0));
    entry.failure_count = std::max(0, payload.value("failure_count", 0));
    entry.confidence = payload.value("confidence", 0.0);
    if (payload.contains("last_success") && payload["last_success"].is_string()) {
        entry.last_success = payload["last_success"].get<std::string>();
    }
    if (payload.contains("last_failure") && payload["last_failure"].is_string()) {
        entry.last_failure = payload["last_failure"].get<std::string>();
    }
    if (payload.contains("typical_duration_ms") &&
        payload["typical_duration_ms"].is_number_integer()) {
        entry.typical_duration_ms = payload["typical_duration_ms"].get<std::int64_t>();
    }
    if (payload.contains("verification") && payload["verification"].is_object()) {
        const auto& v = payload["verification"];
        VerificationInfo info;
        info.method = v.value("method", std::string());
        info.verified_at = v.value("verified_at", std::string());
        for (auto it = v.begin(); it != v.end(); ++it) {
            if (it.key() != "method" && it.key() != "verified_at" &&
                it.value().is_number_integer()) {
                info.details[it.key()] = it.value().get<std::int64_t>();
            }
        }
        entry.verification = info;
    }
    return entry;
}

json rejection_to_json(const RejectedCommand& rejection) {
    json payload;
    payload["command"] = rejection.command;
    payload["suggested_by"] = rejection.suggested_by;
    payload["rejected_at"] = rejection.rejected_at;
    payload["reason"] = rejection.reason;
    return payload;
}

RejectedCommand rejection_from_json(const json& payload) {
    RejectedCommand rejection;
    rejection.command = payload.at("command").get<std::string>();
    rejection.suggested_by = payload.value("suggested_by", std::string("unknown"));
    rejection.rejected_at = payload.value("rejected_at", std::string());
    rejection.reason = payload.value("reason", std::string());
    return rejection;
}

}  // namespace

double compute_confidence(const int success_count, const int failure_count,
                          const core::config::TrustConfig& config) {
    const int total = success_count + failure_count;
    if (total <= 0) {
        return 0.0;
    }
    double empirical = static_cast<double>(success_count) / static_cast<double>(total);
    if (success_count < config.min_successes_for_full_weight) {
        empirical *= 0.5;
    }
    return std::min(empirical, config.confidence_cap);
}

TrustLedger::TrustLedger(std::filesystem::path project_root,
                         core::config::TrustConfig config)
    : config_(std::move(config)),
      ledger_path_(project_root / config_.data_dir / config_.ledger_file),
      audit_log_(project_root / config_.data_dir / config_.audit_file) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
}

void TrustLedger::reset_locked() {
    const std::string now = core::time::now_iso8601();
    version_ = config_.ledger_version;
    project_id_ = core::config::generate_project_id();
    created_ = now;
    last_updated_ = now;
    last_updated_by_ = "unknown";
    detected_.clear();
    commands_.clear();
    rejected_.clear();
    environment_ = json::object();
}

void TrustLedger::load_locked() {
    std::error_code ec;
    if (!std::filesystem::exists(ledger_path_, ec) || ec) {
        reset_locked();
        return;
    }

    std::ifstream in(ledger_path_);
    if (!in.is_open()) {
        LOG_WARN("TrustLedger: could not open " + ledger_path_.string() +
                 ", starting fresh");
        reset_locked();
        return;
    }

    try {
        const json doc = json::parse(in);
        if (!doc.is_object()) {
            LOG_WARN("TrustLedger: " + ledger_path_.string() +
                     " is not a JSON object, starting fresh");
            reset_locked();
            return;
        }

        std::map<std::string, CommandEntry> commands;
        if (doc.contains("commands")) {
            const auto& section = doc.at("commands");
            for (auto it = section.begin(); it != section.end(); ++it) {
                commands[it.key()] = entry_from_json(it.value());
            }
        }

        std::deque<RejectedCommand> rejected;
        if (doc.contains("rejected_commands")) {
            for (const auto& payload : doc.at("rejected_commands")) {
                rejected.push_back(rejection_from_json(payload));
            }
        }
        while (rejected.size() > config_.max_rejections) {
            rejected.pop_front();
        }

        std::map<std::string, std::string> detected;
        if (doc.contains("detected")) {
            const auto& section = doc.at("detected");
            for (auto it = section.begin(); it != section.end(); ++it) {
                if (it.value().is_string()) {
                    detected[it.key()] = it.value().get<std::string>();
                }
            }
        }

        const std::string now = core::time::now_iso8601();
        version_ = doc.value("version", config_.ledger_version);
        project_id_ = doc.value("project_id", std::string());
        if (project_id_.empty()) {
            project_id_ = core::config::generate_project_id();
        }
        created_ = doc.value("created", now);
        last_updated_ = doc.value("last_updated", now);
        last_updated_by_ = doc.value("last_updated_by", std::string("unknown"));
        detected_ = std::move(detected);
        commands_ = std::move(commands);
        rejected_ = std::move(rejected);
        environment_ = doc.contains("environment") && doc.at("environment").is_object()
                           ? doc.at("environment")
                           : json::object();
        LOG_DEBUG("TrustLedger: loaded " + std::to_string(commands_.size()) +
                  " commands from " + ledger_path_.string());
    } catch (const json::exception& e) {
        LOG_WARN("TrustLedger: could not parse " + ledger_path_.string() + " (" +
                 e.what() + "), starting fresh");
        reset_locked();
    }
}

core::errors::Result<bool> TrustLedger::persist_locked(const std::string& updated_by) {
    last_updated_ = core::time::now_iso8601();
    last_updated_by_ = updated_by;

    json commands = json::object();
    for (const auto& [type, entry] : commands_) {
        commands[type] = entry_to_json(entry);
    }
    json rejected = json::array();
    for (const auto& rejection : rejected_) {
        rejected.push_back(rejection_to_json(rejection));
    }

    json doc;
    doc["version"] = version_;
    doc["project_id"] = project_id_;
    doc["created"] = created_;
    doc["last_updated"] = last_updated_;
    doc["last_updated_by"] = last_updated_by_;
    doc["detected"] = detected_;
    doc["commands"] = commands;
    doc["rejected_commands"] = rejected;
    doc["environment"] = environment_;

    std::error_code ec;
    std::filesystem::create_directories(ledger_path_.parent_path(), ec);
    if (ec) {
        return TrustError{ErrorCategory::Storage,
                          "Unable to create ledger directory: " +
                              ledger_path_.parent_path().string(),
                          "ledger_dir_create_failed"};
    }

    // Write then rename, so a reader never sees a half-written document.
    auto temp_path = ledger_path_;
    temp_path += ".tmp-" + core::config::generate_scratch_suffix();
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return TrustError{ErrorCategory::Storage,
                              "Unable to open ledger for writing: " + temp_path.string(),
                              "ledger_open_failed"};
        }
        out << doc.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!out.good()) {
            std::filesystem::remove(temp_path, ec);
            return TrustError{ErrorCategory::Storage,
                              "Unable to write ledger: " + temp_path.string(),
                              "ledger_write_failed"};
        }
    }

    std::filesystem::rename(temp_path, ledger_path_, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return TrustError{ErrorCategory::Storage,
                          "Unable to replace ledger: " + ledger_path_.string() + " (" +
                              ec.message() + ")",
                          "ledger_rename_failed"};
    }

    LOG_DEBUG("TrustLedger: saved " + ledger_path_.string());
    return true;
}

void TrustLedger::audit_locked(const std::string& event, const json& fields) {
    auto appended = audit_log_.append(event, fields);
    if (core::errors::is_error(appended)) {
        const auto& err = core::errors::get_error(appended);
        LOG_WARN("TrustLedger: audit log write failed [" + err.code + "]: " + err.message);
    }
}

std::optional<std::string> TrustLedger::get_command(const std::string& intent_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = commands_.find(intent_type);
    if (it == commands_.end()) {
        return std::nullopt;
    }
    const auto& entry = it->second;
    if (!entry.verified || entry.confidence < config_.trust_threshold) {
        return std::nullopt;
    }

    audit_locked("USE_LEARNED_CMD", {{"type", intent_type},
                                     {"command", entry.command},
                                     {"confidence", entry.confidence}});
    return entry.command;
}

core::errors::Result<CommandEntry> TrustLedger::learn_command(
    const std::string& intent_type, const std::string& command,
    const std::string& source) {
    if (intent_type.empty() || command.empty()) {
        return TrustError{ErrorCategory::Input,
                          "Intent type and command are required to learn a command.",
                          "invalid_learn_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CommandEntry entry;
    entry.command = command;
    entry.learned_at = core::time::now_iso8601();
    entry.learned_from = source;
    commands_[intent_type] = entry;

    LOG_INFO("TrustLedger: learned " + intent_type + " = '" + command + "' from " + source);
    auto saved = persist_locked(source);
    audit_locked("LEARN_CMD", {{"type", intent_type},
                               {"command", command},
                               {"source", source},
                               {"verified", false}});
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return entry;
}

core::errors::Result<bool> TrustLedger::update_result(
    const std::string& intent_type, const bool success,
    const std::optional<std::int64_t> duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = commands_.find(intent_type);
    if (it == commands_.end()) {
        return false;
    }

    auto& entry = it->second;
    if (success) {
        ++entry.success_count;
        entry.last_success = core::time::now_iso8601();
        if (duration_ms.has_value() && !entry.typical_duration_ms.has_value()) {
            entry.typical_duration_ms = duration_ms;
        }
    } else {
        ++entry.failure_count;
        entry.last_failure = core::time::now_iso8601();
    }
    entry.confidence = compute_confidence(entry.success_count, entry.failure_count, config_);

    auto saved = persist_locked("unknown");
    json fields = {{"type", intent_type},
                   {"command", entry.command},
                   {"result", success ? "success" : "failure"},
                   {"confidence", entry.confidence}};
    fields["duration_ms"] = duration_ms.has_value() ? json(duration_ms.value()) : json();
    audit_locked("EXEC_CMD", fields);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return true;
}

core::errors::Result<bool> TrustLedger::mark_verified(
    const std::string& intent_type, const std::string& method,
    const std::map<std::string, std::int64_t>& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = commands_.find(intent_type);
    if (it == commands_.end()) {
        return false;
    }

    auto& entry = it->second;
    entry.verified = true;
    VerificationInfo info;
    info.method = method;
    info.verified_at = core::time::now_iso8601();
    info.details = details;
    entry.verification = info;
    entry.confidence = std::max(entry.confidence, config_.trust_threshold);

    auto saved = persist_locked("unknown");
    audit_locked("VERIFY_CMD", {{"type", intent_type},
                                {"command", entry.command},
                                {"method", method},
                                {"result", "verified"}});
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return true;
}

core::errors::Result<std::size_t> TrustLedger::reject(const std::string& command,
                                                      const std::string& source,
                                                      const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    RejectedCommand rejection;
    rejection.command = command;
    rejection.suggested_by = source;
    rejection.reason = reason;
    rejection.rejected_at = core::time::now_iso8601();
    rejected_.push_back(rejection);
    while (rejected_.size() > config_.max_rejections) {
        rejected_.pop_front();
    }

    LOG_INFO("TrustLedger: rejected '" + command + "' from " + source + ": " + reason);
    auto saved = persist_locked(source);
    audit_locked("REJECT_CMD",
                 {{"command", command}, {"source", source}, {"reason", reason}});
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return rejected_.size();
}

core::errors::Result<bool> TrustLedger::clear(const std::string& intent_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (commands_.erase(intent_type) == 0) {
        return false;
    }

    LOG_INFO("TrustLedger: cleared " + intent_type);
    auto saved = persist_locked("unknown");
    audit_locked("CLEAR_CMD", {{"type", intent_type}});
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return true;
}

core::errors::Result<bool> TrustLedger::set_project_info(
    const std::map<std::string, std::string>& facts) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : facts) {
        if (!value.empty()) {
            detected_[key] = value;
        }
    }
    return persist_locked("unknown");
}

std::map<std::string, std::string> TrustLedger::known_commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> known;
    for (const auto& [type, entry] : commands_) {
        if (entry.verified && entry.confidence > config_.introspection_threshold) {
            known[type] = entry.command;
        }
    }
    return known;
}

std::optional<CommandEntry> TrustLedger::entry(const std::string& intent_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = commands_.find(intent_type);
    if (it == commands_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::deque<RejectedCommand> TrustLedger::rejected_commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

std::map<std::string, std::string> TrustLedger::project_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detected_;
}

nlohmann::json TrustLedger::environment() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return environment_;
}

std::string TrustLedger::project_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return project_id_;
}

}  // namespace cmdtrust::ledger
