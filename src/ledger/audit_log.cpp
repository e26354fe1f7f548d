#include "ledger/audit_log.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include "core/time/timestamp.hpp"

namespace cmdtrust::ledger {

using core::errors::ErrorCategory;
using core::errors::TrustError;
using nlohmann::json;

AuditLog::AuditLog(std::filesystem::path log_path) : log_path_(std::move(log_path)) {}

core::errors::Result<std::filesystem::path> AuditLog::append(
    const std::string& event, const json& fields) const {
    if (event.empty()) {
        return TrustError{ErrorCategory::Input, "Audit event name cannot be empty.",
                          "invalid_audit_event"};
    }

    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return TrustError{ErrorCategory::Storage,
                              "Unable to create audit log directory: " + parent.string(),
                              "audit_dir_create_failed"};
        }
    }

    json entry;
    entry["timestamp"] = core::time::now_iso8601();
    entry["event"] = event;
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            entry[it.key()] = it.value();
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return TrustError{ErrorCategory::Storage,
                          "Unable to open audit log: " + log_path_.string(),
                          "audit_open_failed"};
    }

    out << entry.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return TrustError{ErrorCategory::Storage,
                          "Unable to write audit event: " + log_path_.string(),
                          "audit_write_failed"};
    }

    return log_path_;
}

}  // namespace cmdtrust::ledger
