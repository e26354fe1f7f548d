#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cmdtrust::protocol {

enum class ResponseStatus {
    AlreadyKnown,
    NeedAnswer,
    Rejected,
    Invalid,
    Learned,
    UnknownCommand,
    Success,
    Failure,
    Timeout,
    Error,
    AlreadyConfigured,
    NeedTeaching,
    Cleared,
    Ok
};

struct AskRequest {
    std::string intent;
    std::map<std::string, std::string> context;
    std::vector<std::string> tried;
    std::string question = "What command should I use?";
};

struct TeachRequest {
    std::string intent;
    std::string command;
    bool save = true;
    std::string source = "agent";
};

struct RunRequest {
    std::string intent;
};

struct ClearRequest {
    std::string intent;
};

struct AskResponse {
    ResponseStatus status = ResponseStatus::NeedAnswer;
    std::optional<std::string> command;
    std::string question;
    std::map<std::string, std::string> context;
    std::vector<std::string> suggestions;
    std::string message;
};

struct TeachResponse {
    ResponseStatus status = ResponseStatus::Invalid;
    std::string command;
    bool verified = false;
    std::optional<std::string> reason;
    std::optional<std::string> output_sample;
    std::optional<std::int64_t> duration_ms;
    std::string message;
};

struct RunResponse {
    ResponseStatus status = ResponseStatus::UnknownCommand;
    std::string command;
    std::optional<int> exit_code;
    std::string stdout_tail;
    std::string stderr_tail;
    std::optional<std::int64_t> duration_ms;
    std::optional<std::string> error;
    std::string message;
};

struct ProjectResponse {
    ResponseStatus status = ResponseStatus::NeedTeaching;
    std::map<std::string, std::string> detected;
    std::map<std::string, std::string> known_commands;
    std::map<std::string, std::string> questions;
    std::string message;
};

struct MemoryStatus {
    ResponseStatus status = ResponseStatus::Ok;
    std::string project_id;
    std::map<std::string, std::string> project_info;
    std::map<std::string, std::string> known_commands;
    std::string learned_file;
    std::size_t rejected_count = 0;
    std::string message;
};

struct ClearResponse {
    ResponseStatus status = ResponseStatus::UnknownCommand;
    std::string intent_type;
    std::string message;
};

inline std::string to_string(const ResponseStatus status) {
    switch (status) {
        case ResponseStatus::AlreadyKnown:
            return "already_known";
        case ResponseStatus::NeedAnswer:
            return "need_answer";
        case ResponseStatus::Rejected:
            return "rejected";
        case ResponseStatus::Invalid:
            return "invalid";
        case ResponseStatus::Learned:
            return "learned";
        case ResponseStatus::UnknownCommand:
            return "unknown_command";
        case ResponseStatus::Success:
            return "success";
        case ResponseStatus::Failure:
            return "failure";
        case ResponseStatus::Timeout:
            return "timeout";
        case ResponseStatus::Error:
            return "error";
        case ResponseStatus::AlreadyConfigured:
            return "already_configured";
        case ResponseStatus::NeedTeaching:
            return "need_teaching";
        case ResponseStatus::Cleared:
            return "cleared";
        case ResponseStatus::Ok:
            return "ok";
        default:
            return "unknown";
    }
}

}  // namespace cmdtrust::protocol
