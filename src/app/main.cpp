#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/request_dispatcher.hpp"
#include "core/errors/trust_errors.hpp"
#include "core/logging/logger.hpp"
#include "detection/project_detector.hpp"
#include "exec/process_runner.hpp"
#include "ledger/trust_ledger.hpp"
#include "runtime/learning_protocol.hpp"

namespace {

std::string render(const nlohmann::json& response, int indent) {
    return response.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = cmdtrust::app::cli::parse_and_validate(argc, argv);
    if (cmdtrust::core::errors::is_error(parsed)) {
        const auto& err = cmdtrust::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& options = cmdtrust::core::errors::get_value(parsed);
    if (options.verbose) {
        cmdtrust::core::logging::Logger::get().set_min_level(
            cmdtrust::core::logging::LogLevel::DEBUG);
    }

    // 2. Open the project's ledger and tag log lines with its project id
    cmdtrust::ledger::TrustLedger ledger(options.project_root);
    cmdtrust::core::logging::Logger::get().set_project_id(ledger.project_id());
    LOG_DEBUG("Ledger: " + ledger.ledger_path().string());

    cmdtrust::exec::ShellProcessRunner runner;
    cmdtrust::detection::MarkerFileDetector detector;
    cmdtrust::runtime::LearningProtocol protocol(options.project_root, ledger, runner, detector);
    cmdtrust::app::RequestDispatcher dispatcher(protocol);

    if (options.mode == cmdtrust::app::cli::CliMode::Serve) {
        LOG_INFO("Serving JSON requests on stdin for " + options.project_root.string());
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            std::cout << render(dispatcher.dispatch_line(line), -1) << std::endl;
        }
        return 0;
    }

    std::cout << render(dispatcher.dispatch(options.request), 2) << std::endl;
    return 0;
}
