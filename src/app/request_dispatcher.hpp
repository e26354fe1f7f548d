#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "runtime/learning_protocol.hpp"

namespace cmdtrust::app {

// Routes JSON requests to the learning protocol by their "op" field.
// Always answers with a JSON object carrying a "status"; malformed input
// becomes a status "error" response.
class RequestDispatcher {
public:
    explicit RequestDispatcher(runtime::LearningProtocol& protocol);

    nlohmann::json dispatch(const nlohmann::json& request);

    // One line of the serve loop: parse, then dispatch.
    nlohmann::json dispatch_line(const std::string& line);

private:
    nlohmann::json bootstrap(const nlohmann::json& request);

    runtime::LearningProtocol& protocol_;
};

}  // namespace cmdtrust::app
