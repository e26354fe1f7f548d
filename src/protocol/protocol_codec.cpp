#include "protocol/protocol_codec.hpp"

#include <string>

namespace cmdtrust::protocol {

using core::errors::ErrorCategory;
using core::errors::TrustError;
using nlohmann::json;

namespace {

TrustError field_error(const std::string& field, const std::string& expected) {
    return TrustError{ErrorCategory::Input,
                      "Field '" + field + "' must be " + expected + ".",
                      "invalid_field"};
}

core::errors::Result<std::string> required_string(const json& payload, const char* field) {
    if (!payload.contains(field)) {
        return TrustError{ErrorCategory::Input,
                          std::string("Missing required field '") + field + "'.",
                          "missing_field"};
    }
    const auto& value = payload.at(field);
    if (!value.is_string() || value.get<std::string>().empty()) {
        return field_error(field, "a non-empty string");
    }
    return value.get<std::string>();
}

core::errors::Result<bool> require_object(const json& payload) {
    if (!payload.is_object()) {
        return TrustError{ErrorCategory::Input, "Request must be a JSON object.",
                          "invalid_request"};
    }
    return true;
}

template <typename T>
void put_optional(json& payload, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        payload[key] = *value;
    }
}

}  // namespace

core::errors::Result<AskRequest> ask_request_from_json(const json& payload) {
    auto object = require_object(payload);
    if (core::errors::is_error(object)) {
        return core::errors::get_error(object);
    }
    auto intent = required_string(payload, "intent");
    if (core::errors::is_error(intent)) {
        return core::errors::get_error(intent);
    }

    AskRequest request;
    request.intent = core::errors::get_value(intent);

    if (payload.contains("question") && !payload.at("question").is_null()) {
        if (!payload.at("question").is_string()) {
            return field_error("question", "a string");
        }
        request.question = payload.at("question").get<std::string>();
    }

    if (payload.contains("tried") && !payload.at("tried").is_null()) {
        const auto& tried = payload.at("tried");
        if (!tried.is_array()) {
            return field_error("tried", "an array of strings");
        }
        for (const auto& item : tried) {
            if (!item.is_string()) {
                return field_error("tried", "an array of strings");
            }
            request.tried.push_back(item.get<std::string>());
        }
    }

    if (payload.contains("context") && !payload.at("context").is_null()) {
        const auto& context = payload.at("context");
        if (!context.is_object()) {
            return field_error("context", "an object");
        }
        for (auto it = context.begin(); it != context.end(); ++it) {
            // Non-string context values are kept in their JSON text form.
            request.context[it.key()] =
                it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }

    return request;
}

core::errors::Result<TeachRequest> teach_request_from_json(const json& payload) {
    auto object = require_object(payload);
    if (core::errors::is_error(object)) {
        return core::errors::get_error(object);
    }
    auto intent = required_string(payload, "intent");
    if (core::errors::is_error(intent)) {
        return core::errors::get_error(intent);
    }
    auto command = required_string(payload, "command");
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }

    TeachRequest request;
    request.intent = core::errors::get_value(intent);
    request.command = core::errors::get_value(command);

    if (payload.contains("save")) {
        if (!payload.at("save").is_boolean()) {
            return field_error("save", "a boolean");
        }
        request.save = payload.at("save").get<bool>();
    }
    if (payload.contains("source")) {
        auto source = required_string(payload, "source");
        if (core::errors::is_error(source)) {
            return core::errors::get_error(source);
        }
        request.source = core::errors::get_value(source);
    }
    return request;
}

core::errors::Result<RunRequest> run_request_from_json(const json& payload) {
    auto object = require_object(payload);
    if (core::errors::is_error(object)) {
        return core::errors::get_error(object);
    }
    auto intent = required_string(payload, "intent");
    if (core::errors::is_error(intent)) {
        return core::errors::get_error(intent);
    }
    RunRequest request;
    request.intent = core::errors::get_value(intent);
    return request;
}

core::errors::Result<ClearRequest> clear_request_from_json(const json& payload) {
    auto object = require_object(payload);
    if (core::errors::is_error(object)) {
        return core::errors::get_error(object);
    }
    auto intent = required_string(payload, "intent");
    if (core::errors::is_error(intent)) {
        return core::errors::get_error(intent);
    }
    ClearRequest request;
    request.intent = core::errors::get_value(intent);
    return request;
}

json to_json(const AskResponse& response) {
    json payload;
    payload["status"] = to_string(response.status);
    put_optional(payload, "command", response.command);
    if (response.status == ResponseStatus::NeedAnswer) {
        payload["question"] = response.question;
        payload["context"] = response.context;
        payload["suggestions"] = response.suggestions;
    }
    payload["message"] = response.message;
    return payload;
}

json to_json(const TeachResponse& response) {
    json payload;
    payload["status"] = to_string(response.status);
    if (!response.command.empty()) {
        payload["command"] = response.command;
    }
    if (response.status == ResponseStatus::Learned ||
        response.status == ResponseStatus::AlreadyKnown) {
        payload["verified"] = response.verified;
    }
    put_optional(payload, "reason", response.reason);
    put_optional(payload, "output_sample", response.output_sample);
    put_optional(payload, "duration_ms", response.duration_ms);
    payload["message"] = response.message;
    return payload;
}

json to_json(const RunResponse& response) {
    json payload;
    payload["status"] = to_string(response.status);
    if (!response.command.empty()) {
        payload["command"] = response.command;
    }
    put_optional(payload, "exit_code", response.exit_code);
    if (response.status == ResponseStatus::Success ||
        response.status == ResponseStatus::Failure ||
        response.status == ResponseStatus::Timeout) {
        payload["stdout"] = response.stdout_tail;
        payload["stderr"] = response.stderr_tail;
    }
    put_optional(payload, "duration_ms", response.duration_ms);
    put_optional(payload, "error", response.error);
    payload["message"] = response.message;
    return payload;
}

json to_json(const ProjectResponse& response) {
    json payload;
    payload["status"] = to_string(response.status);
    payload["known_commands"] = response.known_commands;
    if (response.status == ResponseStatus::NeedTeaching) {
        payload["detected"] = response.detected;
        payload["questions"] = response.questions;
    }
    payload["message"] = response.message;
    return payload;
}

json to_json(const MemoryStatus& status) {
    json payload;
    payload["status"] = to_string(status.status);
    payload["project_id"] = status.project_id;
    payload["project_info"] = status.project_info;
    payload["known_commands"] = status.known_commands;
    payload["learned_file"] = status.learned_file;
    payload["rejected_count"] = status.rejected_count;
    payload["message"] = status.message;
    return payload;
}

json to_json(const ClearResponse& response) {
    json payload;
    payload["status"] = to_string(response.status);
    payload["intent_type"] = response.intent_type;
    payload["message"] = response.message;
    return payload;
}

json error_to_json(const TrustError& error) {
    json payload;
    payload["status"] = to_string(ResponseStatus::Error);
    payload["code"] = error.code;
    payload["category"] = core::errors::to_string(error.category);
    payload["reason"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

}  // namespace cmdtrust::protocol
