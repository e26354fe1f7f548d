#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/trust_errors.hpp"
#include "protocol/learning_contract.hpp"

namespace cmdtrust::protocol {

// Request decoding. Missing or mistyped fields come back as Input errors
// naming the field.
core::errors::Result<AskRequest> ask_request_from_json(const nlohmann::json& payload);
core::errors::Result<TeachRequest> teach_request_from_json(const nlohmann::json& payload);
core::errors::Result<RunRequest> run_request_from_json(const nlohmann::json& payload);
core::errors::Result<ClearRequest> clear_request_from_json(const nlohmann::json& payload);

nlohmann::json to_json(const AskResponse& response);
nlohmann::json to_json(const TeachResponse& response);
nlohmann::json to_json(const RunResponse& response);
nlohmann::json to_json(const ProjectResponse& response);
nlohmann::json to_json(const MemoryStatus& status);
nlohmann::json to_json(const ClearResponse& response);

// {"status": "error", "code": ..., "reason": ...} plus the hint when set.
nlohmann::json error_to_json(const core::errors::TrustError& error);

}  // namespace cmdtrust::protocol
