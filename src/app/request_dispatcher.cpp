#include "app/request_dispatcher.hpp"

#include "core/logging/logger.hpp"
#include "protocol/protocol_codec.hpp"
#include "runtime/command_provider.hpp"

namespace cmdtrust::app {

using core::errors::ErrorCategory;
using core::errors::TrustError;
using nlohmann::json;

RequestDispatcher::RequestDispatcher(runtime::LearningProtocol& protocol)
    : protocol_(protocol) {}

json RequestDispatcher::dispatch(const json& request) {
    if (!request.is_object() || !request.contains("op") || !request.at("op").is_string()) {
        return protocol::error_to_json(TrustError{
            ErrorCategory::Input, "Request must be an object with a string 'op' field.",
            "invalid_request"});
    }

    const std::string op = request.at("op").get<std::string>();
    LOG_DEBUG("Dispatching " + op);

    if (op == "ask_command") {
        auto parsed = protocol::ask_request_from_json(request);
        if (core::errors::is_error(parsed)) {
            return protocol::error_to_json(core::errors::get_error(parsed));
        }
        return protocol::to_json(protocol_.ask_command(core::errors::get_value(parsed)));
    }
    if (op == "teach_command") {
        auto parsed = protocol::teach_request_from_json(request);
        if (core::errors::is_error(parsed)) {
            return protocol::error_to_json(core::errors::get_error(parsed));
        }
        return protocol::to_json(protocol_.teach_command(core::errors::get_value(parsed)));
    }
    if (op == "run_command") {
        auto parsed = protocol::run_request_from_json(request);
        if (core::errors::is_error(parsed)) {
            return protocol::error_to_json(core::errors::get_error(parsed));
        }
        return protocol::to_json(protocol_.run_command(core::errors::get_value(parsed)));
    }
    if (op == "clear_command") {
        auto parsed = protocol::clear_request_from_json(request);
        if (core::errors::is_error(parsed)) {
            return protocol::error_to_json(core::errors::get_error(parsed));
        }
        return protocol::to_json(protocol_.clear_command(core::errors::get_value(parsed)));
    }
    if (op == "bootstrap_command") {
        return bootstrap(request);
    }
    if (op == "learn_project") {
        return protocol::to_json(protocol_.learn_project());
    }
    if (op == "get_memory_status") {
        return protocol::to_json(protocol_.get_memory_status());
    }

    return protocol::error_to_json(TrustError{ErrorCategory::Input,
                                              "Unknown op: " + op, "unknown_op",
                                              "Use ask_command, teach_command, run_command, "
                                              "clear_command, bootstrap_command, "
                                              "learn_project or get_memory_status."});
}

json RequestDispatcher::dispatch_line(const std::string& line) {
    // Parse without exceptions; a discarded value means the line was not JSON.
    const json request = json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        return protocol::error_to_json(
            TrustError{ErrorCategory::Input, "Request line is not valid JSON.", "invalid_json"});
    }
    return dispatch(request);
}

json RequestDispatcher::bootstrap(const json& request) {
    auto parsed = protocol::run_request_from_json(request);
    if (core::errors::is_error(parsed)) {
        return protocol::error_to_json(core::errors::get_error(parsed));
    }
    const std::string& intent = core::errors::get_value(parsed).intent;

    auto info = protocol_.get_memory_status().project_info;
    if (info.count("language") == 0) {
        info = protocol_.learn_project().detected;
    }
    const auto language = info.find("language");
    const runtime::HeuristicProvider provider(
        language == info.end() ? std::string() : language->second);
    return protocol::to_json(protocol_.bootstrap_command(intent, provider));
}

}  // namespace cmdtrust::app
