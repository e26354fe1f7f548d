#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace cmdtrust::protocol {

// How and when a learned command was verified. Numeric detail keys such as
// duration_ms are flattened into the persisted object.
struct VerificationInfo {
    std::string method;
    std::string verified_at;
    std::map<std::string, std::int64_t> details;
};

struct CommandEntry {
    std::string command;
    std::string learned_at;
    std::string learned_from;
    bool verified = false;
    int success_count = 0;
    int failure_count = 0;
    double confidence = 0.0;
    std::optional<std::string> last_success;
    std::optional<std::string> last_failure;
    std::optional<std::int64_t> typical_duration_ms;
    std::optional<VerificationInfo> verification;
};

struct RejectedCommand {
    std::string command;
    std::string suggested_by;
    std::string reason;
    std::string rejected_at;
};

// Outcome of one verification attempt. Never persisted as-is.
struct VerificationResult {
    bool safe = false;
    bool valid = false;
    std::optional<std::string> reason;
    std::optional<std::string> output_sample;
    std::optional<std::int64_t> duration_ms;
    std::size_t files_modified = 0;
};

}  // namespace cmdtrust::protocol
